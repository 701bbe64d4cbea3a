#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/layout/aspect_classifier.hpp"
#include "internal/model/shape_category.hpp"
#include "internal/model/submission.hpp"
#include "internal/util/errors.hpp"

namespace slideshow::layout {

/*
  A pool entry that survived partitioning, with the size it was classified by.
  Points into the caller's pool, which must outlive the composition call.
*/
struct Candidate {
  const model::Submission* submission = nullptr;
  model::Dimensions        size;
};

using Bucket = std::vector<Candidate>;

struct PartitionResult {
  std::array<Bucket, 3> buckets;

  std::size_t candidates     = 0;
  std::size_t duplicates     = 0;
  std::size_t excluded       = 0;
  std::size_t unclassifiable = 0;

  // Throws util::InvalidArgument for kUnclassifiable.
  Bucket& Get(model::ShapeCategory category) {
    return buckets[IndexOf(category)];
  }

  const Bucket& Get(model::ShapeCategory category) const {
    return buckets[IndexOf(category)];
  }

 private:
  static std::size_t IndexOf(model::ShapeCategory category) {
    const auto index = model::BucketIndex(category);
    if (!index) {
      throw util::InvalidArgument("no bucket for category " + std::string(model::ToString(category)));
    }
    return *index;
  }
};

/*
  Splits a candidate pool into landscape / square / portrait buckets,
  keeping pool order inside each bucket.

  Dropped entries are counted, never silently lost:
    - a repeated id (only the first occurrence is kept)
    - an id listed in exclude_ids
    - an unclassifiable shape
*/
class CategoryPartitioner {
public:
  explicit CategoryPartitioner(AspectClassifier classifier);

  PartitionResult Partition(const std::vector<model::Submission>& pool,
                            const std::unordered_set<std::string>& exclude_ids = {}) const;

private:
  AspectClassifier classifier_;
};

} // namespace slideshow::layout
