#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace slideshow::model {

enum class ShapeCategory : std::uint8_t {
  kUnclassifiable = 0,
  kLandscape      = 1,
  kSquare         = 2,
  kPortrait       = 3,
};

// Categories that can be scheduled, in declaration order.
inline constexpr std::array<ShapeCategory, 3> kSchedulableCategories = {
    ShapeCategory::kLandscape,
    ShapeCategory::kSquare,
    ShapeCategory::kPortrait,
};

constexpr std::string_view ToString(ShapeCategory category) {
  switch (category) {
    case ShapeCategory::kLandscape:
      return "landscape";
    case ShapeCategory::kSquare:
      return "square";
    case ShapeCategory::kPortrait:
      return "portrait";
    case ShapeCategory::kUnclassifiable:
    default:
      return "unclassifiable";
  }
}

constexpr std::optional<ShapeCategory> ParseShapeCategory(std::string_view name) {
  if (name == "landscape") {
    return ShapeCategory::kLandscape;
  }
  if (name == "square") {
    return ShapeCategory::kSquare;
  }
  if (name == "portrait") {
    return ShapeCategory::kPortrait;
  }
  return std::nullopt;
}

// Slot of a schedulable category; unclassifiable has none.
constexpr std::optional<std::size_t> BucketIndex(ShapeCategory category) {
  switch (category) {
    case ShapeCategory::kLandscape:
      return 0;
    case ShapeCategory::kSquare:
      return 1;
    case ShapeCategory::kPortrait:
      return 2;
    case ShapeCategory::kUnclassifiable:
    default:
      return std::nullopt;
  }
}

} // namespace slideshow::model
