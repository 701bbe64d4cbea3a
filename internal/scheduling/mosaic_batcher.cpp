#include "mosaic_batcher.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace slideshow::scheduling {

MosaicBatcher::MosaicBatcher(const layout::Bucket& bucket, std::uint32_t group_size)
    : bucket_(&bucket), group_size_(group_size) {
  if (group_size_ == 0) {
    throw util::InvalidArgument("mosaic group size must be positive");
  }
}

bool MosaicBatcher::HasNext() const {
  return Remaining() >= group_size_;
}

std::size_t MosaicBatcher::Remaining() const {
  return bucket_->size() - cursor_;
}

Group MosaicBatcher::Next() {
  if (!HasNext()) {
    throw util::InvalidState("mosaic batcher has " + std::to_string(Remaining()) + " entries left, needs " +
                             std::to_string(group_size_));
  }

  const auto first = bucket_->begin() + static_cast<std::ptrdiff_t>(cursor_);
  Group      group(first, first + group_size_);
  cursor_ += group_size_;
  return group;
}

std::vector<Group> MosaicBatcher::BatchAll(const layout::Bucket& bucket, std::uint32_t group_size) {
  MosaicBatcher      batcher(bucket, group_size);
  std::vector<Group> groups;
  groups.reserve(bucket.size() / group_size);
  while (batcher.HasNext()) {
    groups.push_back(batcher.Next());
  }
  return groups;
}

} // namespace slideshow::scheduling
