#pragma once

#include <cstdint>
#include <vector>

#include "internal/layout/aspect_classifier.hpp"
#include "internal/model/shape_category.hpp"
#include "internal/model/submission.hpp"

namespace slideshow::scheduling {

inline constexpr std::int64_t kDefaultPlaylistLimit = 10;
inline constexpr std::uint32_t kLandscapeGroupSize  = 1;
inline constexpr std::uint32_t kPortraitGroupSize   = 3;
inline constexpr std::uint32_t kSquareGroupSize     = 6;

/*
  Tunables for one PlaylistComposer.

  A group size of 1 produces single slides; anything larger produces mosaics
  laid out "<n>-up".
*/
struct ComposerOptions {
  std::int64_t default_limit = kDefaultPlaylistLimit;

  std::uint32_t landscape_group_size = kLandscapeGroupSize;
  std::uint32_t portrait_group_size  = kPortraitGroupSize;
  std::uint32_t square_group_size    = kSquareGroupSize;

  // Emission order within one composition iteration.
  std::vector<model::ShapeCategory> priority = {
      model::ShapeCategory::kLandscape,
      model::ShapeCategory::kPortrait,
      model::ShapeCategory::kSquare,
  };

  layout::ClassifierMode classifier_mode = layout::ClassifierMode::kTolerant;
  model::Dimensions      placeholder     = layout::kPlaceholderSize;

  std::uint32_t GroupSize(model::ShapeCategory category) const {
    switch (category) {
      case model::ShapeCategory::kPortrait:
        return portrait_group_size;
      case model::ShapeCategory::kSquare:
        return square_group_size;
      case model::ShapeCategory::kLandscape:
      default:
        return landscape_group_size;
    }
  }
};

/*
  Rejects options that would let one submission be placed twice or stall a
  composition: non-positive limit or group size, an unschedulable or repeated
  priority entry, a placeholder with a zero side. Throws util::InvalidConfig.
*/
void Validate(const ComposerOptions& options);

} // namespace slideshow::scheduling
