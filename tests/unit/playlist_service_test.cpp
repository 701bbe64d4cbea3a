#include "internal/service/playlist_service.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "internal/scheduling/playlist_composer.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace slideshow::composer::v1;

slideshow::service::PlaylistService MakeService() {
  slideshow::service::ServiceContext ctx;
  ctx.composer = std::make_shared<slideshow::scheduling::PlaylistComposer>();
  return slideshow::service::PlaylistService(ctx);
}

void AddSubmission(CandidatePool* pool, const std::string& id, uint32_t width, uint32_t height,
                   uint64_t play_count = 0) {
  auto* submission = pool->add_submissions();
  submission->set_id(id);
  submission->set_image_url("https://img.example/" + id + ".jpg");
  submission->set_width(width);
  submission->set_height(height);
  submission->set_play_count(play_count);
  submission->mutable_created_at()->set_seconds(1'700'000'000);
}

void TestComposeReturnsPlaylistIdsAndStats() {
  auto service = MakeService();

  ComposeRequest req;
  req.mutable_pool()->set_event_id("evt");
  AddSubmission(req.mutable_pool(), "l1", 1920, 1080);
  for (int i = 0; i < 3; ++i) {
    AddSubmission(req.mutable_pool(), "p" + std::to_string(i), 1080, 1920);
  }
  AddSubmission(req.mutable_pool(), "s0", 1080, 1080);
  req.set_limit(5);

  const auto resp = service.Compose(req);

  assert(resp.playlist().slides_size() == 2);
  assert(resp.playlist().slides(0).type() == SLIDE_TYPE_SINGLE);
  assert(resp.playlist().slides(0).category() == SHAPE_CATEGORY_LANDSCAPE);
  assert(resp.playlist().slides(1).type() == SLIDE_TYPE_MOSAIC);
  assert(resp.playlist().slides(1).layout() == "3-up");
  assert(resp.playlist().slides(1).members(2).id() == "p2");

  assert(resp.submission_ids_size() == 4);
  assert(resp.submission_ids(0) == "l1");
  assert(resp.submission_ids(3) == "p2");

  assert(resp.stats().candidates() == 5);
  assert(resp.stats().categories_size() == 3);
  bool saw_square = false;
  for (const auto& category : resp.stats().categories()) {
    if (category.category() == SHAPE_CATEGORY_SQUARE) {
      saw_square = true;
      assert(category.leftover() == 1);
      assert(category.group_size() == 6);
    }
  }
  assert(saw_square);
}

void TestComposeUsesDefaultLimitWhenUnset() {
  auto service = MakeService();

  ComposeRequest req;
  for (int i = 0; i < 12; ++i) {
    AddSubmission(req.mutable_pool(), "l" + std::to_string(i), 1600, 900);
  }

  assert(service.Compose(req).playlist().slides_size() == 10);

  req.set_limit(-1);
  assert(service.Compose(req).playlist().slides_size() == 0);
}

void TestComposeHonoursExclusions() {
  auto service = MakeService();

  ComposeRequest req;
  AddSubmission(req.mutable_pool(), "a", 1920, 1080);
  AddSubmission(req.mutable_pool(), "b", 1920, 1080);
  req.add_exclude_ids("a");

  const auto resp = service.Compose(req);
  assert(resp.submission_ids_size() == 1);
  assert(resp.submission_ids(0) == "b");
  assert(resp.stats().excluded() == 1);
}

void TestComposeRejectsSubmissionWithoutTimestamp() {
  auto service = MakeService();

  ComposeRequest req;
  auto*          submission = req.mutable_pool()->add_submissions();
  submission->set_id("untimed");

  bool threw = false;
  try {
    (void)service.Compose(req);
  } catch (const slideshow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestNextCandidate() {
  auto service = MakeService();

  NextCandidateRequest req;
  AddSubmission(req.mutable_pool(), "seen", 1920, 1080, 4);
  AddSubmission(req.mutable_pool(), "fresh", 1920, 1080, 0);

  auto resp = service.NextCandidate(req);
  assert(resp.has_candidate());
  assert(resp.candidate().members(0).id() == "fresh");
  assert(resp.total_available() == 2);

  req.add_exclude_ids("fresh");
  req.add_exclude_ids("seen");
  resp = service.NextCandidate(req);
  assert(!resp.has_candidate());
  assert(resp.total_available() == 0);
}

void TestClassify() {
  auto service = MakeService();

  ClassifyRequest req;
  req.set_width(0);
  req.set_height(0);
  auto resp = service.Classify(req);
  assert(resp.category() == SHAPE_CATEGORY_LANDSCAPE);
  assert(resp.width() == 1920);
  assert(resp.height() == 1080);

  req.set_width(700);
  req.set_height(1000);
  resp = service.Classify(req);
  assert(resp.category() == SHAPE_CATEGORY_PORTRAIT);
}

} // namespace

int main() {
  TestComposeReturnsPlaylistIdsAndStats();
  TestComposeUsesDefaultLimitWhenUnset();
  TestComposeHonoursExclusions();
  TestComposeRejectsSubmissionWithoutTimestamp();
  TestNextCandidate();
  TestClassify();

  std::cout << "slideshow_unit_playlist_service: pass\n";
  return 0;
}
