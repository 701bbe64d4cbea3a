#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/shape_category.hpp"
#include "internal/model/submission.hpp"

namespace slideshow::model {

enum class SlideType : std::uint8_t {
  kSingle = 1,
  kMosaic = 2,
};

constexpr std::string_view ToString(SlideType type) {
  return type == SlideType::kMosaic ? "mosaic" : "single";
}

struct SlideMember {
  std::string id;
  std::string image_url;
  Dimensions  size;

  bool operator==(const SlideMember&) const = default;
};

/*
  One step of the rotation: a single image, or a fixed-size mosaic of images
  that share a shape category.
*/
struct Slide {
  SlideType     type     = SlideType::kSingle;
  ShapeCategory category = ShapeCategory::kLandscape;

  // "<n>-up" for mosaics, empty for singles.
  std::string layout;

  std::vector<SlideMember> members;

  bool operator==(const Slide&) const = default;
};

using Playlist = std::vector<Slide>;

inline std::string MosaicLayout(std::uint32_t group_size) {
  return std::to_string(group_size) + "-up";
}

} // namespace slideshow::model
