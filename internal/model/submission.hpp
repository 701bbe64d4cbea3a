#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace slideshow::model {

struct Dimensions {
  std::uint32_t width  = 0;
  std::uint32_t height = 0;

  bool Known() const {
    return width > 0 && height > 0;
  }

  bool operator==(const Dimensions&) const = default;
};

/*
  Read-only snapshot of one submission in an event's pool.

  Sizes of zero mean "not recorded". The final size is the one produced after
  framing/cropping; the original size is what was uploaded.
*/
struct Submission {
  std::string id;
  std::string image_url;

  Dimensions final_size;
  Dimensions original_size;

  std::uint64_t play_count = 0;

  std::chrono::system_clock::time_point created_at{};
};

} // namespace slideshow::model
