#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/layout/category_partitioner.hpp"

namespace slideshow::scheduling {

using Group = std::vector<layout::Candidate>;

/*
  Read cursor over an ordered bucket that hands out fixed-size,
  non-overlapping groups from the front.

  A group is only available while at least group_size entries remain;
  a shorter tail is never returned and stays unconsumed for this call.
  The bucket must outlive the batcher.
*/
class MosaicBatcher {
public:
  MosaicBatcher(const layout::Bucket& bucket, std::uint32_t group_size);

  bool HasNext() const;

  // Throws util::InvalidState when HasNext() is false.
  Group Next();

  std::size_t Remaining() const;
  std::size_t Consumed() const {
    return cursor_;
  }

  std::uint32_t group_size() const {
    return group_size_;
  }

  // Every full group of the bucket, in order.
  static std::vector<Group> BatchAll(const layout::Bucket& bucket, std::uint32_t group_size);

private:
  const layout::Bucket* bucket_;
  std::uint32_t         group_size_;
  std::size_t           cursor_ = 0;
};

} // namespace slideshow::scheduling
