#include "composer_options.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace slideshow::scheduling {

using model::ShapeCategory;

void Validate(const ComposerOptions& options) {
  if (options.default_limit <= 0) {
    throw util::InvalidConfig("default limit must be positive, got " + std::to_string(options.default_limit));
  }

  for (const auto category : model::kSchedulableCategories) {
    if (options.GroupSize(category) == 0) {
      throw util::InvalidConfig(std::string(model::ToString(category)) + " group size must be positive");
    }
  }

  for (auto it = options.priority.begin(); it != options.priority.end(); ++it) {
    if (!model::BucketIndex(*it)) {
      throw util::InvalidConfig("priority lists unschedulable category " + std::string(model::ToString(*it)));
    }
    if (std::find(options.priority.begin(), it, *it) != it) {
      throw util::InvalidConfig("priority lists " + std::string(model::ToString(*it)) + " twice");
    }
  }

  if (!options.placeholder.Known()) {
    throw util::InvalidConfig("placeholder size must be positive on both sides");
  }
}

} // namespace slideshow::scheduling
