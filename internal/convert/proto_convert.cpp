#include "proto_convert.hpp"

#include "internal/util/time.hpp"

namespace slideshow::convert {

namespace v1 = slideshow::composer::v1;

model::Submission FromProto(const v1::Submission& submission) {
  model::Submission out;
  out.id            = submission.id();
  out.image_url     = submission.image_url();
  out.final_size    = {submission.width(), submission.height()};
  out.original_size = {submission.original_width(), submission.original_height()};
  out.play_count    = submission.play_count();
  out.created_at    = util::FromProto(submission.created_at());
  return out;
}

std::vector<model::Submission> FromProto(const v1::CandidatePool& pool) {
  std::vector<model::Submission> out;
  out.reserve(pool.submissions_size());
  for (const auto& submission : pool.submissions()) {
    out.push_back(FromProto(submission));
  }
  return out;
}

v1::ShapeCategory ToProto(model::ShapeCategory category) {
  switch (category) {
    case model::ShapeCategory::kLandscape:
      return v1::SHAPE_CATEGORY_LANDSCAPE;
    case model::ShapeCategory::kSquare:
      return v1::SHAPE_CATEGORY_SQUARE;
    case model::ShapeCategory::kPortrait:
      return v1::SHAPE_CATEGORY_PORTRAIT;
    case model::ShapeCategory::kUnclassifiable:
    default:
      return v1::SHAPE_CATEGORY_UNCLASSIFIABLE;
  }
}

v1::SlideType ToProto(model::SlideType type) {
  return type == model::SlideType::kMosaic ? v1::SLIDE_TYPE_MOSAIC : v1::SLIDE_TYPE_SINGLE;
}

v1::Slide ToProto(const model::Slide& slide) {
  v1::Slide out;
  out.set_type(ToProto(slide.type));
  out.set_category(ToProto(slide.category));
  out.set_layout(slide.layout);
  for (const auto& member : slide.members) {
    auto* m = out.add_members();
    m->set_id(member.id);
    m->set_image_url(member.image_url);
    m->set_width(member.size.width);
    m->set_height(member.size.height);
  }
  return out;
}

v1::Playlist ToProto(const model::Playlist& playlist) {
  v1::Playlist out;
  for (const auto& slide : playlist) {
    *out.add_slides() = ToProto(slide);
  }
  return out;
}

v1::CompositionStats ToProto(const scheduling::CompositionStats& stats) {
  v1::CompositionStats out;
  out.set_candidates(stats.candidates);
  out.set_duplicates(stats.duplicates);
  out.set_excluded(stats.excluded);
  out.set_unclassifiable(stats.unclassifiable);
  out.set_iterations(stats.iterations);
  for (const auto& category : stats.categories) {
    auto* c = out.add_categories();
    c->set_category(ToProto(category.category));
    c->set_group_size(category.group_size);
    c->set_bucketed(category.bucketed);
    c->set_consumed(category.consumed);
    c->set_leftover(category.leftover);
  }
  return out;
}

} // namespace slideshow::convert
