#include "play_count_ledger.hpp"

#include <mutex>

namespace slideshow::playcount {

void PlayCountLedger::RecordPlayed(const std::vector<std::string>& ids, util::TimePoint played_at) {
  std::unique_lock lock(mutex_);
  for (const auto& id : ids) {
    auto& entry = entries_[id];
    ++entry.plays;
    entry.last_played_at = played_at;
  }
}

std::uint64_t PlayCountLedger::PlayCount(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end())
    return 0;
  return it->second.plays;
}

std::optional<util::TimePoint> PlayCountLedger::LastPlayedAt(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end())
    return std::nullopt;
  return it->second.last_played_at;
}

std::vector<model::Submission> PlayCountLedger::Apply(const std::vector<model::Submission>& pool) const {
  std::shared_lock lock(mutex_);

  std::vector<model::Submission> out(pool);
  for (auto& submission : out) {
    auto it = entries_.find(submission.id);
    if (it != entries_.end())
      submission.play_count += it->second.plays;
  }
  return out;
}

std::size_t PlayCountLedger::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace slideshow::playcount
