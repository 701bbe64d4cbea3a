#pragma once

#include <string>

#include "slideshow/composer/v1.hpp"

namespace slideshow::pool {

/*
  Reads a candidate pool snapshot (YAML or JSON) into a CandidatePool.

  Every submission needs a non-empty id and a created_at timestamp; play_count
  and dimensions may be omitted. Failures throw util::InvalidArgument.
*/
class PoolLoader {
 public:
  static slideshow::composer::v1::CandidatePool LoadFromFile(const std::string& path);

  static slideshow::composer::v1::CandidatePool LoadFromString(const std::string& text);

  static void Validate(const slideshow::composer::v1::CandidatePool& pool);
};

} // namespace slideshow::pool
