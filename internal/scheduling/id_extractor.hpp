#pragma once

#include <string>
#include <vector>

#include "internal/model/slide.hpp"

namespace slideshow::scheduling {

/*
  Submission ids of a playlist in display order, one per slide member.
  This is the list handed to the play-count writer once the cycle was shown.
*/
std::vector<std::string> ExtractSubmissionIds(const model::Playlist& playlist);

} // namespace slideshow::scheduling
