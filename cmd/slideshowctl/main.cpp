#include <google/protobuf/util/json_util.h>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/convert/proto_convert.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/playcount/play_count_ledger.hpp"
#include "internal/pool/pool_loader.hpp"
#include "internal/scheduling/id_extractor.hpp"
#include "slideshow/composer/v1.hpp"

using namespace slideshow::composer::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  slideshowctl [--config <config.yaml>] compose <pool.yaml> [limit] [--exclude id,id,...]\n"
            << "  slideshowctl [--config <config.yaml>] next <pool.yaml> [--exclude id,id,...]\n"
            << "  slideshowctl [--config <config.yaml>] simulate <pool.yaml> <cycles> [limit]\n"
            << "  slideshowctl [--config <config.yaml>] classify <width> <height>\n";
}

static std::optional<std::int64_t> ParseInt(const std::string& value) {
  try {
    size_t     consumed = 0;
    const auto parsed   = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<std::uint32_t> ParseDimension(const std::string& value) {
  const auto parsed = ParseInt(value);
  if (!parsed || *parsed < 0 || *parsed > std::numeric_limits<std::uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(*parsed);
}

static std::vector<std::string> SplitIds(const std::string& csv) {
  std::vector<std::string> ids;
  std::stringstream        in(csv);
  std::string              id;
  while (std::getline(in, id, ',')) {
    if (!id.empty()) {
      ids.push_back(id);
    }
  }
  return ids;
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render JSON: " + std::string(status.message()));
  }
  std::cout << json;
}

static std::string DescribeSlide(const Slide& slide) {
  std::string out = slide.type() == SLIDE_TYPE_MOSAIC ? slide.layout() : "single";
  out += "[";
  for (int i = 0; i < slide.members_size(); ++i) {
    if (i) out += ",";
    out += slide.members(i).id();
  }
  out += "]";
  return out;
}

static void Simulate(slideshow::service::PlaylistService& service, const CandidatePool& pool, std::int64_t cycles,
                    std::optional<std::int64_t> limit) {
  slideshow::playcount::PlayCountLedger ledger;
  const auto                            snapshot = slideshow::convert::FromProto(pool);

  for (std::int64_t cycle = 1; cycle <= cycles; ++cycle) {
    // Overlay the counters accumulated so far, as the store would after each cycle.
    ComposeRequest req;
    *req.mutable_pool()->mutable_event_id() = pool.event_id();
    for (const auto& submission : pool.submissions()) {
      auto* s = req.mutable_pool()->add_submissions();
      *s      = submission;
      s->set_play_count(submission.play_count() + ledger.PlayCount(submission.id()));
    }
    if (limit) {
      req.set_limit(*limit);
    }

    const auto resp = service.Compose(req);
    const std::vector<std::string> shown(resp.submission_ids().begin(), resp.submission_ids().end());
    ledger.RecordPlayed(shown);

    std::cout << "cycle " << cycle << ":";
    for (const auto& slide : resp.playlist().slides()) {
      std::cout << ' ' << DescribeSlide(slide);
    }
    std::cout << '\n';
  }

  std::cout << "play counts:\n";
  for (const auto& submission : ledger.Apply(snapshot)) {
    std::cout << "  " << submission.id << ' ' << submission.play_count << '\n';
  }
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  std::vector<std::string> exclude_ids;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] != "--exclude") {
      continue;
    }
    if (i + 1 >= args.size()) {
      Usage();
      return 1;
    }
    exclude_ids = SplitIds(args[i + 1]);
    args.erase(args.begin() + static_cast<std::ptrdiff_t>(i), args.begin() + static_cast<std::ptrdiff_t>(i) + 2);
    break;
  }

  if (args.empty()) {
    Usage();
    return 1;
  }
  const std::string cmd = args[0];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    slideshow::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = slideshow::config::ConfigLoader::LoadFromYaml(config_path);
    }
    slideshow::observability::InitializeLogging(config);

    auto  app     = slideshow::factory::Build(config);
    auto& service = *app.playlist_service;

    if (cmd == "classify" && args.size() == 3) {
      const auto width  = ParseDimension(args[1]);
      const auto height = ParseDimension(args[2]);
      if (!width || !height) {
        Usage();
        return 1;
      }
      ClassifyRequest req;
      req.set_width(*width);
      req.set_height(*height);
      PrintJson(service.Classify(req));
    } else if (cmd == "compose" && (args.size() == 2 || args.size() == 3)) {
      ComposeRequest req;
      *req.mutable_pool() = slideshow::pool::PoolLoader::LoadFromFile(args[1]);
      if (args.size() == 3) {
        const auto limit = ParseInt(args[2]);
        if (!limit) {
          Usage();
          return 1;
        }
        req.set_limit(*limit);
      }
      for (const auto& id : exclude_ids) {
        req.add_exclude_ids(id);
      }
      PrintJson(service.Compose(req));
    } else if (cmd == "next" && args.size() == 2) {
      NextCandidateRequest req;
      *req.mutable_pool() = slideshow::pool::PoolLoader::LoadFromFile(args[1]);
      for (const auto& id : exclude_ids) {
        req.add_exclude_ids(id);
      }
      PrintJson(service.NextCandidate(req));
    } else if (cmd == "simulate" && (args.size() == 3 || args.size() == 4)) {
      const auto cycles = ParseInt(args[2]);
      const auto limit  = args.size() == 4 ? ParseInt(args[3]) : std::nullopt;
      if (!cycles || *cycles <= 0 || (args.size() == 4 && !limit)) {
        Usage();
        return 1;
      }
      const auto pool = slideshow::pool::PoolLoader::LoadFromFile(args[1]);
      Simulate(service, pool, *cycles, limit);
    } else {
      Usage();
      return 1;
    }

    slideshow::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SLIDESHOW_LOG_ERROR("Fatal error", {slideshow::observability::StringField("command", cmd),
                                        slideshow::observability::StringField("error", e.what())});
    slideshow::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
