#include "category_partitioner.hpp"

namespace slideshow::layout {

using model::ShapeCategory;

CategoryPartitioner::CategoryPartitioner(AspectClassifier classifier) : classifier_(classifier) {
}

PartitionResult CategoryPartitioner::Partition(const std::vector<model::Submission>& pool,
                                               const std::unordered_set<std::string>& exclude_ids) const {
  PartitionResult result;
  result.candidates = pool.size();

  std::unordered_set<std::string> seen;
  seen.reserve(pool.size());

  for (const auto& submission : pool) {
    if (!seen.insert(submission.id).second) {
      ++result.duplicates;
      continue;
    }

    if (exclude_ids.count(submission.id)) {
      ++result.excluded;
      continue;
    }

    const auto size     = classifier_.EffectiveSize(submission);
    const auto category = classifier_.Classify(size);
    if (category == ShapeCategory::kUnclassifiable) {
      ++result.unclassifiable;
      continue;
    }

    result.Get(category).push_back(Candidate{&submission, size});
  }

  return result;
}

} // namespace slideshow::layout
