#include "pool_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/config/yaml_proto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace slideshow::pool {

using slideshow::composer::v1::CandidatePool;

namespace {

CandidatePool Parse(const YAML::Node& yaml) {
  CandidatePool pool;
  try {
    config::YamlToMessage(yaml, &pool);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Invalid candidate pool: " + std::string(e.what()));
  }

  PoolLoader::Validate(pool);
  SLIDESHOW_LOG_DEBUG("Candidate pool loaded", {observability::StringField("event_id", pool.event_id()),
                                                observability::IntField("submissions", pool.submissions_size())});
  return pool;
}

} // namespace

CandidatePool PoolLoader::LoadFromFile(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to load candidate pool " + path + ": " + e.what());
  }
  return Parse(yaml);
}

CandidatePool PoolLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to parse candidate pool: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void PoolLoader::Validate(const CandidatePool& pool) {
  for (int i = 0; i < pool.submissions_size(); ++i) {
    const auto& submission = pool.submissions(i);
    if (submission.id().empty()) {
      throw util::InvalidArgument("submission #" + std::to_string(i) + " has no id");
    }
    if (!submission.has_created_at()) {
      throw util::InvalidArgument("submission " + submission.id() + " has no created_at");
    }
  }
}

} // namespace slideshow::pool
