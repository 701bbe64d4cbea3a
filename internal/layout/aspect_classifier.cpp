#include "aspect_classifier.hpp"

#include <cmath>

namespace slideshow::layout {

using model::Dimensions;
using model::ShapeCategory;

namespace {

constexpr double kPortraitMin = 0.4;
constexpr double kPortraitMax = 0.7;
constexpr double kSquareMin   = 0.8;
constexpr double kSquareMax   = 1.2;

constexpr double kStrictTolerance = 0.1;
constexpr double kLandscapeRatio  = 16.0 / 9.0;
constexpr double kSquareRatio     = 1.0;
constexpr double kPortraitRatio   = 9.0 / 16.0;

} // namespace

AspectClassifier::AspectClassifier(ClassifierMode mode, Dimensions placeholder)
    : mode_(mode), placeholder_(placeholder.Known() ? placeholder : kPlaceholderSize) {
}

ShapeCategory AspectClassifier::Classify(std::uint32_t width, std::uint32_t height) const {
  if (height == 0) {
    return mode_ == ClassifierMode::kStrict ? ShapeCategory::kUnclassifiable : ShapeCategory::kLandscape;
  }

  const double ratio = static_cast<double>(width) / static_cast<double>(height);
  return mode_ == ClassifierMode::kStrict ? ClassifyStrict(ratio) : ClassifyTolerant(ratio);
}

ShapeCategory AspectClassifier::Classify(const Dimensions& size) const {
  return Classify(size.width, size.height);
}

Dimensions AspectClassifier::EffectiveSize(const model::Submission& submission) const {
  const auto pick = [](std::uint32_t final_side, std::uint32_t original_side, std::uint32_t fallback) {
    if (final_side > 0) {
      return final_side;
    }
    return original_side > 0 ? original_side : fallback;
  };

  return {pick(submission.final_size.width, submission.original_size.width, placeholder_.width),
          pick(submission.final_size.height, submission.original_size.height, placeholder_.height)};
}

ShapeCategory AspectClassifier::Classify(const model::Submission& submission) const {
  return Classify(EffectiveSize(submission));
}

ShapeCategory AspectClassifier::ClassifyTolerant(double ratio) const {
  if (ratio >= kPortraitMin && ratio <= kPortraitMax) {
    return ShapeCategory::kPortrait;
  }
  if (ratio >= kSquareMin && ratio <= kSquareMax) {
    return ShapeCategory::kSquare;
  }
  // r > 1.2, r < 0.4 and the 0.7..0.8 gap all fall back to landscape.
  return ShapeCategory::kLandscape;
}

ShapeCategory AspectClassifier::ClassifyStrict(double ratio) const {
  if (std::abs(ratio - kLandscapeRatio) < kStrictTolerance) {
    return ShapeCategory::kLandscape;
  }
  if (std::abs(ratio - kSquareRatio) < kStrictTolerance) {
    return ShapeCategory::kSquare;
  }
  if (std::abs(ratio - kPortraitRatio) < kStrictTolerance) {
    return ShapeCategory::kPortrait;
  }
  return ShapeCategory::kUnclassifiable;
}

} // namespace slideshow::layout
