#pragma once

#include "internal/layout/category_partitioner.hpp"

namespace slideshow::scheduling {

/*
  Least-shown-first ordering inside one bucket.

  Key is (play_count, created_at) ascending; equal keys keep pool order.
*/
class FairnessOrderer {
public:
  static bool Before(const layout::Candidate& a, const layout::Candidate& b);

  static void Order(layout::Bucket& bucket);

  static void Order(layout::PartitionResult& partition);
};

} // namespace slideshow::scheduling
