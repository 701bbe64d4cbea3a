#pragma once

#include "service_context.hpp"
#include "slideshow/composer/v1.hpp"

namespace slideshow::service {

/*
  Protobuf-facing entry points of the composer; what an HTTP or RPC layer
  would call per slideshow refresh.

  Requests whose pool has a submission without id or created_at throw
  util::InvalidArgument. Everything else succeeds, possibly with an empty
  playlist.
*/
class PlaylistService {
public:
  explicit PlaylistService(ServiceContext ctx);

  slideshow::composer::v1::ComposeResponse
  Compose(const slideshow::composer::v1::ComposeRequest& req);

  slideshow::composer::v1::NextCandidateResponse
  NextCandidate(const slideshow::composer::v1::NextCandidateRequest& req);

  slideshow::composer::v1::ClassifyResponse
  Classify(const slideshow::composer::v1::ClassifyRequest& req);

private:
  ServiceContext ctx_;
};

}
