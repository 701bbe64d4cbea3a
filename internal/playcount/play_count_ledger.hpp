#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/submission.hpp"
#include "internal/util/time.hpp"

namespace slideshow::playcount {

/*
  In-process stand-in for the play-count writer.

  Accumulates increments from the id lists produced by ExtractSubmissionIds
  and overlays them on a pool snapshot, so repeated compositions see the
  counters move. Thread-safe.
*/
class PlayCountLedger {
 public:
  // One increment per occurrence of an id.
  void RecordPlayed(const std::vector<std::string>& ids, util::TimePoint played_at = util::Now());

  std::uint64_t PlayCount(const std::string& id) const;

  std::optional<util::TimePoint> LastPlayedAt(const std::string& id) const;

  // Copy of pool with recorded increments added to each play_count.
  std::vector<model::Submission> Apply(const std::vector<model::Submission>& pool) const;

  std::size_t size() const;

 private:
  struct Entry {
    std::uint64_t   plays = 0;
    util::TimePoint last_played_at{};
  };

  mutable std::shared_mutex mutex_;

  std::unordered_map<std::string, Entry> entries_;
};

} // namespace slideshow::playcount
