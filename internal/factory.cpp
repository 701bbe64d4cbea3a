#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/shape_category.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace slideshow::factory {

using model::ShapeCategory;

namespace {

layout::ClassifierMode ParseClassifierMode(const std::string& mode) {
  if (mode.empty() || mode == "tolerant") {
    return layout::ClassifierMode::kTolerant;
  }
  if (mode == "strict") {
    return layout::ClassifierMode::kStrict;
  }
  throw util::InvalidConfig("composer.classifier.mode must be 'tolerant' or 'strict', got '" + mode + "'");
}

std::vector<ShapeCategory> ParsePriority(const google::protobuf::RepeatedPtrField<std::string>& names) {
  std::vector<ShapeCategory> priority;
  for (const auto& name : names) {
    const auto category = model::ParseShapeCategory(name);
    if (!category) {
      throw util::InvalidConfig("composer.priority: unknown category '" + name + "'");
    }
    if (std::find(priority.begin(), priority.end(), *category) != priority.end()) {
      throw util::InvalidConfig("composer.priority: category '" + name + "' listed twice");
    }
    priority.push_back(*category);
  }
  return priority;
}

std::uint32_t RequirePositive(std::uint32_t value, const char* field) {
  if (value == 0) {
    throw util::InvalidConfig(std::string(field) + " must be positive");
  }
  return value;
}

} // namespace

scheduling::ComposerOptions BuildComposerOptions(const slideshow::runtime::config::RuntimeConfig& config) {
  scheduling::ComposerOptions options;

  if (!config.has_composer()) {
    return options;
  }
  const auto& composer = config.composer();

  if (composer.has_default_limit()) {
    if (composer.default_limit() == 0) {
      throw util::InvalidConfig("composer.default_limit must be positive");
    }
    options.default_limit = composer.default_limit();
  }

  if (composer.priority_size() > 0) {
    options.priority = ParsePriority(composer.priority());
  }

  if (composer.has_mosaic()) {
    const auto& mosaic = composer.mosaic();
    if (mosaic.has_portrait_group_size()) {
      options.portrait_group_size = RequirePositive(mosaic.portrait_group_size(), "composer.mosaic.portrait_group_size");
    }
    if (mosaic.has_square_group_size()) {
      options.square_group_size = RequirePositive(mosaic.square_group_size(), "composer.mosaic.square_group_size");
    }
  }

  if (composer.has_classifier()) {
    options.classifier_mode = ParseClassifierMode(composer.classifier().mode());
  }

  if (composer.has_placeholder_width() != composer.has_placeholder_height()) {
    throw util::InvalidConfig("composer.placeholder_width and placeholder_height must be set together");
  }
  if (composer.has_placeholder_width()) {
    options.placeholder = {RequirePositive(composer.placeholder_width(), "composer.placeholder_width"),
                           RequirePositive(composer.placeholder_height(), "composer.placeholder_height")};
  }

  scheduling::Validate(options);
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const slideshow::runtime::config::RuntimeConfig& config) {
  Application app;

  app.options  = BuildComposerOptions(config);
  app.composer = std::make_shared<scheduling::PlaylistComposer>(app.options);

  service::ServiceContext ctx;
  ctx.composer         = app.composer;
  app.playlist_service = std::make_shared<service::PlaylistService>(ctx);

  SLIDESHOW_LOG_DEBUG("Composer configured",
                      {observability::IntField("default_limit", app.options.default_limit),
                       observability::IntField("portrait_group_size", app.options.portrait_group_size),
                       observability::IntField("square_group_size", app.options.square_group_size),
                       observability::IntField("priority_length", static_cast<std::int64_t>(app.options.priority.size()))});

  return app;
}

} // namespace slideshow::factory
