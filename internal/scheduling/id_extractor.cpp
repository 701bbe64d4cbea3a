#include "id_extractor.hpp"

namespace slideshow::scheduling {

std::vector<std::string> ExtractSubmissionIds(const model::Playlist& playlist) {
  std::size_t total = 0;
  for (const auto& slide : playlist) {
    total += slide.members.size();
  }

  std::vector<std::string> ids;
  ids.reserve(total);
  for (const auto& slide : playlist) {
    for (const auto& member : slide.members) {
      ids.push_back(member.id);
    }
  }
  return ids;
}

} // namespace slideshow::scheduling
