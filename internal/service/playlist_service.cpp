#include "playlist_service.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>

#include "internal/convert/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pool/pool_loader.hpp"
#include "internal/scheduling/id_extractor.hpp"
#include "internal/scheduling/playlist_composer.hpp"
#include "internal/util/errors.hpp"

namespace slideshow::service {

using namespace slideshow::composer::v1;
using observability::IntField;
using observability::StringField;

namespace {

std::unordered_set<std::string> ToSet(const google::protobuf::RepeatedPtrField<std::string>& ids) {
  return std::unordered_set<std::string>(ids.begin(), ids.end());
}

template <typename Fn>
auto ObserveCall(std::string_view route, const std::string& event_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_us = [&] {
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    SLIDESHOW_LOG_DEBUG("Call completed", {StringField("route", route), StringField("event_id", event_id),
                                           IntField("elapsed_us", elapsed_us())});
    return result;
  } catch (const std::exception& ex) {
    SLIDESHOW_LOG_ERROR("Call failed", {StringField("route", route), StringField("event_id", event_id),
                                        StringField("error", ex.what()), IntField("elapsed_us", elapsed_us())});
    throw;
  }
}

} // namespace

PlaylistService::PlaylistService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.composer) {
    throw util::InvalidArgument("PlaylistService requires a composer");
  }
}

ComposeResponse PlaylistService::Compose(const ComposeRequest& req) {
  return ObserveCall("Compose", req.pool().event_id(), [&] {
    pool::PoolLoader::Validate(req.pool());

    const auto pool  = convert::FromProto(req.pool());
    const auto limit = req.has_limit() ? std::optional<std::int64_t>(req.limit()) : std::nullopt;

    const auto composition = ctx_.composer->Compose(pool, limit, ToSet(req.exclude_ids()));

    ComposeResponse resp;
    *resp.mutable_playlist() = convert::ToProto(composition.playlist);
    for (auto& id : scheduling::ExtractSubmissionIds(composition.playlist)) {
      resp.add_submission_ids(std::move(id));
    }
    *resp.mutable_stats() = convert::ToProto(composition.stats);

    if (composition.playlist.empty()) {
      SLIDESHOW_LOG_INFO("No content to display", {StringField("event_id", req.pool().event_id()),
                                                   IntField("candidates", req.pool().submissions_size())});
    }
    return resp;
  });
}

NextCandidateResponse PlaylistService::NextCandidate(const NextCandidateRequest& req) {
  return ObserveCall("NextCandidate", req.pool().event_id(), [&] {
    pool::PoolLoader::Validate(req.pool());

    const auto pool        = convert::FromProto(req.pool());
    const auto composition = ctx_.composer->Compose(pool, 1, ToSet(req.exclude_ids()));
    const auto& stats      = composition.stats;

    NextCandidateResponse resp;
    resp.set_total_available(stats.candidates - stats.duplicates - stats.excluded);
    if (!composition.playlist.empty()) {
      *resp.mutable_candidate() = convert::ToProto(composition.playlist.front());
    }
    return resp;
  });
}

ClassifyResponse PlaylistService::Classify(const ClassifyRequest& req) {
  model::Submission probe;
  probe.final_size = {req.width(), req.height()};

  const auto& classifier = ctx_.composer->classifier();
  const auto  size       = classifier.EffectiveSize(probe);

  ClassifyResponse resp;
  resp.set_category(convert::ToProto(classifier.Classify(size)));
  resp.set_width(size.width);
  resp.set_height(size.height);
  resp.set_ratio(static_cast<double>(size.width) / static_cast<double>(size.height));
  return resp;
}

}
