#pragma once

#include <cstdint>

#include "internal/model/shape_category.hpp"
#include "internal/model/submission.hpp"

namespace slideshow::layout {

enum class ClassifierMode : std::uint8_t {
  // Wide bands; everything lands in some category.
  kTolerant = 0,
  // +/-0.1 around 16:9, 1:1 and 9:16; anything else is unclassifiable.
  kStrict = 1,
};

inline constexpr model::Dimensions kPlaceholderSize{1920, 1080};

/*
  Maps pixel dimensions to a display shape.

  Tolerant bands (ratio = width / height):
      0.4 <= r <= 0.7   portrait
      0.8 <= r <= 1.2   square
      r > 1.2           landscape
      anything else     landscape
*/
class AspectClassifier {
public:
  explicit AspectClassifier(ClassifierMode mode = ClassifierMode::kTolerant,
                            model::Dimensions placeholder = kPlaceholderSize);

  model::ShapeCategory Classify(std::uint32_t width, std::uint32_t height) const;
  model::ShapeCategory Classify(const model::Dimensions& size) const;

  // Per side: final if recorded, else original if recorded, else the placeholder.
  model::Dimensions EffectiveSize(const model::Submission& submission) const;

  model::ShapeCategory Classify(const model::Submission& submission) const;

  ClassifierMode mode() const {
    return mode_;
  }

private:
  model::ShapeCategory ClassifyTolerant(double ratio) const;
  model::ShapeCategory ClassifyStrict(double ratio) const;

  ClassifierMode    mode_;
  model::Dimensions placeholder_;
};

} // namespace slideshow::layout
