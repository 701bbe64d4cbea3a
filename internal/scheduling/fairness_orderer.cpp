#include "fairness_orderer.hpp"

#include <algorithm>

namespace slideshow::scheduling {

bool FairnessOrderer::Before(const layout::Candidate& a, const layout::Candidate& b) {
  if (a.submission->play_count != b.submission->play_count) {
    return a.submission->play_count < b.submission->play_count;
  }
  return a.submission->created_at < b.submission->created_at;
}

void FairnessOrderer::Order(layout::Bucket& bucket) {
  std::stable_sort(bucket.begin(), bucket.end(), &FairnessOrderer::Before);
}

void FairnessOrderer::Order(layout::PartitionResult& partition) {
  for (auto& bucket : partition.buckets) {
    Order(bucket);
  }
}

} // namespace slideshow::scheduling
