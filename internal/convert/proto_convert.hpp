#pragma once

#include <vector>

#include "internal/model/shape_category.hpp"
#include "internal/model/slide.hpp"
#include "internal/model/submission.hpp"
#include "internal/scheduling/playlist_composer.hpp"
#include "slideshow/composer/v1.hpp"

namespace slideshow::convert {

/*
  Wire <-> model mapping for the composer's protobuf surface.
*/

model::Submission              FromProto(const slideshow::composer::v1::Submission& submission);
std::vector<model::Submission> FromProto(const slideshow::composer::v1::CandidatePool& pool);

slideshow::composer::v1::ShapeCategory ToProto(model::ShapeCategory category);
slideshow::composer::v1::SlideType     ToProto(model::SlideType type);

slideshow::composer::v1::Slide            ToProto(const model::Slide& slide);
slideshow::composer::v1::Playlist         ToProto(const model::Playlist& playlist);
slideshow::composer::v1::CompositionStats ToProto(const scheduling::CompositionStats& stats);

} // namespace slideshow::convert
