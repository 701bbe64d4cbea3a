#include "playlist_composer.hpp"

#include <algorithm>
#include <utility>

#include "internal/layout/category_partitioner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduling/fairness_orderer.hpp"
#include "internal/scheduling/mosaic_batcher.hpp"

namespace slideshow::scheduling {

using model::ShapeCategory;
using model::Slide;
using model::SlideType;
using observability::IntField;
using observability::StringField;

namespace {

Slide MakeSlide(ShapeCategory category, const Group& group, std::uint32_t group_size) {
  Slide slide;
  slide.category = category;
  if (group_size > 1) {
    slide.type   = SlideType::kMosaic;
    slide.layout = model::MosaicLayout(group_size);
  } else {
    slide.type = SlideType::kSingle;
  }

  slide.members.reserve(group.size());
  for (const auto& candidate : group) {
    slide.members.push_back({candidate.submission->id, candidate.submission->image_url, candidate.size});
  }
  return slide;
}

struct Cursor {
  ShapeCategory category;
  MosaicBatcher batcher;
};

} // namespace

PlaylistComposer::PlaylistComposer(ComposerOptions options)
    : options_(std::move(options)), classifier_(options_.classifier_mode, options_.placeholder) {
  Validate(options_);
}

Composition PlaylistComposer::Compose(const std::vector<model::Submission>& pool,
                                      std::optional<std::int64_t> limit,
                                      const std::unordered_set<std::string>& exclude_ids) const {
  const std::int64_t budget = limit.value_or(options_.default_limit);

  auto partition = layout::CategoryPartitioner(classifier_).Partition(pool, exclude_ids);
  FairnessOrderer::Order(partition);

  if (partition.unclassifiable > 0) {
    SLIDESHOW_LOG_WARN("Dropped unclassifiable submissions",
                       {IntField("count", static_cast<std::int64_t>(partition.unclassifiable))});
  }

  std::vector<Cursor> cursors;
  cursors.reserve(options_.priority.size());
  for (const auto category : options_.priority) {
    cursors.push_back(Cursor{category, MosaicBatcher(partition.Get(category), options_.GroupSize(category))});
  }

  Composition composition;
  auto&       playlist = composition.playlist;
  auto&       stats    = composition.stats;

  const auto full = [&] { return static_cast<std::int64_t>(playlist.size()) >= budget; };

  while (!full()) {
    ++stats.iterations;
    bool emitted = false;

    for (auto& cursor : cursors) {
      if (full()) {
        break;
      }
      if (!cursor.batcher.HasNext()) {
        continue;
      }
      playlist.push_back(MakeSlide(cursor.category, cursor.batcher.Next(), cursor.batcher.group_size()));
      emitted = true;
    }

    if (!emitted) {
      break;
    }
  }

  stats.candidates     = partition.candidates;
  stats.duplicates     = partition.duplicates;
  stats.excluded       = partition.excluded;
  stats.unclassifiable = partition.unclassifiable;

  for (const auto category : model::kSchedulableCategories) {
    CategoryStats category_stats;
    category_stats.category   = category;
    category_stats.group_size = options_.GroupSize(category);
    category_stats.bucketed   = partition.Get(category).size();

    const auto it = std::find_if(cursors.begin(), cursors.end(),
                                 [category](const Cursor& c) { return c.category == category; });
    category_stats.consumed = it == cursors.end() ? 0 : it->batcher.Consumed();
    category_stats.leftover = category_stats.bucketed - category_stats.consumed;
    stats.categories.push_back(category_stats);
  }

  SLIDESHOW_LOG_DEBUG("Playlist composed",
                      {IntField("candidates", static_cast<std::int64_t>(stats.candidates)),
                       IntField("slides", static_cast<std::int64_t>(playlist.size())),
                       IntField("limit", budget),
                       IntField("iterations", static_cast<std::int64_t>(stats.iterations)),
                       StringField("classifier",
                                   classifier_.mode() == layout::ClassifierMode::kStrict ? "strict" : "tolerant")});

  return composition;
}

std::optional<Slide> PlaylistComposer::NextCandidate(const std::vector<model::Submission>& pool,
                                                     const std::unordered_set<std::string>& exclude_ids) const {
  auto composition = Compose(pool, 1, exclude_ids);
  if (composition.playlist.empty()) {
    return std::nullopt;
  }
  return std::move(composition.playlist.front());
}

} // namespace slideshow::scheduling
