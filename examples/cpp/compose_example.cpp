#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/slide.hpp"
#include "internal/model/submission.hpp"
#include "internal/scheduling/id_extractor.hpp"
#include "internal/scheduling/playlist_composer.hpp"

using slideshow::model::Submission;

namespace {

Submission Make(std::string id, std::uint32_t w, std::uint32_t h, std::uint64_t plays, int minute) {
  Submission s;
  s.id         = std::move(id);
  s.image_url  = "https://cdn.example.com/" + s.id + ".jpg";
  s.final_size = {w, h};
  s.play_count = plays;
  s.created_at = std::chrono::system_clock::time_point{} + std::chrono::minutes(minute);
  return s;
}

} // namespace

int main() {
  // Two landscapes, three portraits and a square that has not filled a mosaic yet.
  const std::vector<Submission> pool = {
      Make("beach", 1920, 1080, 2, 1), Make("toast", 1920, 1080, 0, 2), Make("cake", 1080, 1920, 1, 3),
      Make("dance", 1080, 1920, 0, 4), Make("hug", 1080, 1920, 0, 5),   Make("logo", 1000, 1000, 0, 6),
  };

  slideshow::scheduling::PlaylistComposer composer;
  const auto                              composition = composer.Compose(pool);

  std::cout << "slides: " << composition.playlist.size() << '\n';
  for (const auto& slide : composition.playlist) {
    std::cout << "  " << slideshow::model::ToString(slide.category) << ' ' << slideshow::model::ToString(slide.type);
    if (!slide.layout.empty()) {
      std::cout << ' ' << slide.layout;
    }
    std::cout << ':';
    for (const auto& member : slide.members) {
      std::cout << ' ' << member.id;
    }
    std::cout << '\n';
  }

  // These ids are what the caller hands back to the play-count writer.
  std::cout << "played:";
  for (const auto& id : slideshow::scheduling::ExtractSubmissionIds(composition.playlist)) {
    std::cout << ' ' << id;
  }
  std::cout << '\n';

  return 0;
}
