#include "internal/scheduling/mosaic_batcher.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"
#include "submission_fixtures.hpp"

namespace {

using slideshow::layout::Bucket;
using slideshow::layout::Candidate;
using slideshow::model::Submission;
using slideshow::scheduling::MosaicBatcher;
using namespace slideshow::testing;

std::vector<Submission> Portraits(int count) {
  std::vector<Submission> pool;
  for (int i = 0; i < count; ++i) {
    pool.push_back(Portrait("p" + std::to_string(i)));
  }
  return pool;
}

Bucket ToBucket(const std::vector<Submission>& pool) {
  Bucket bucket;
  for (const auto& submission : pool) {
    bucket.push_back(Candidate{&submission, submission.final_size});
  }
  return bucket;
}

void TestGroupsAreConsecutiveAndNonOverlapping() {
  const auto pool   = Portraits(7);
  const auto bucket = ToBucket(pool);

  const auto groups = MosaicBatcher::BatchAll(bucket, 3);

  assert(groups.size() == 2);
  assert(groups[0].size() == 3);
  assert(groups[1].size() == 3);
  assert(groups[0][0].submission->id == "p0");
  assert(groups[0][2].submission->id == "p2");
  assert(groups[1][0].submission->id == "p3");
  assert(groups[1][2].submission->id == "p5");
}

void TestRemainderIsNeverEmitted() {
  for (int count = 0; count < 20; ++count) {
    const auto pool   = Portraits(count);
    const auto bucket = ToBucket(pool);

    MosaicBatcher batcher(bucket, 6);
    size_t        emitted = 0;
    while (batcher.HasNext()) {
      const auto group = batcher.Next();
      assert(group.size() == 6);
      emitted += group.size();
    }
    assert(batcher.Remaining() < 6);
    assert(batcher.Remaining() == static_cast<size_t>(count) - emitted);
    assert(batcher.Consumed() == emitted);
  }
}

void TestBelowThresholdYieldsNothing() {
  const auto pool   = Portraits(2);
  const auto bucket = ToBucket(pool);

  MosaicBatcher batcher(bucket, 3);
  assert(!batcher.HasNext());
  assert(batcher.Remaining() == 2);

  bool threw = false;
  try {
    (void)batcher.Next();
  } catch (const slideshow::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "Next() without a full group must throw.");
}

void TestGroupSizeOneWalksEveryEntry() {
  const auto pool   = Portraits(4);
  const auto bucket = ToBucket(pool);

  const auto groups = MosaicBatcher::BatchAll(bucket, 1);
  assert(groups.size() == 4);
  assert(groups[3][0].submission->id == "p3");
}

void TestZeroGroupSizeIsRejected() {
  const Bucket bucket;
  bool         threw = false;
  try {
    MosaicBatcher batcher(bucket, 0);
  } catch (const slideshow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestGroupsAreConsecutiveAndNonOverlapping();
  TestRemainderIsNeverEmitted();
  TestBelowThresholdYieldsNothing();
  TestGroupSizeOneWalksEveryEntry();
  TestZeroGroupSizeIsRejected();

  std::cout << "slideshow_unit_mosaic_batcher: pass\n";
  return 0;
}
