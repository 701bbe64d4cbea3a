#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/layout/aspect_classifier.hpp"
#include "internal/model/slide.hpp"
#include "internal/model/submission.hpp"
#include "internal/scheduling/composer_options.hpp"

namespace slideshow::scheduling {

struct CategoryStats {
  model::ShapeCategory category   = model::ShapeCategory::kLandscape;
  std::uint32_t        group_size = 1;
  std::size_t          bucketed   = 0;
  std::size_t          consumed   = 0;
  std::size_t          leftover   = 0;
};

struct CompositionStats {
  std::size_t candidates     = 0;
  std::size_t duplicates     = 0;
  std::size_t excluded       = 0;
  std::size_t unclassifiable = 0;
  std::size_t iterations     = 0;

  std::vector<CategoryStats> categories;
};

struct Composition {
  model::Playlist  playlist;
  CompositionStats stats;
};

/*
  Builds the next stretch of a slideshow from a pool snapshot.

  Pipeline per call: partition by shape -> fairness order per bucket ->
  round-robin over the categories in priority order, one unit per category
  per iteration (a single for group size 1, a mosaic otherwise).

  Stops when the playlist reaches the limit or an iteration emits nothing.
  Holds no state between calls; the same pool always yields the same
  playlist.
*/
class PlaylistComposer {
public:
  // Throws util::InvalidConfig when options fail Validate().
  explicit PlaylistComposer(ComposerOptions options = {});

  // A missing limit means options().default_limit; limit <= 0 yields an empty playlist.
  Composition Compose(const std::vector<model::Submission>& pool,
                      std::optional<std::int64_t> limit = std::nullopt,
                      const std::unordered_set<std::string>& exclude_ids = {}) const;

  // Best single next slide for a rolling buffer, skipping exclude_ids.
  std::optional<model::Slide> NextCandidate(const std::vector<model::Submission>& pool,
                                            const std::unordered_set<std::string>& exclude_ids = {}) const;

  const ComposerOptions& options() const {
    return options_;
  }

  const layout::AspectClassifier& classifier() const {
    return classifier_;
  }

private:
  ComposerOptions          options_;
  layout::AspectClassifier classifier_;
};

} // namespace slideshow::scheduling
