#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/scheduling/composer_options.hpp"
#include "internal/scheduling/playlist_composer.hpp"
#include "internal/service/playlist_service.hpp"

namespace slideshow::factory {

/*
  Application

  Owns everything the CLI drives. Composition itself is stateless, so one
  instance serves any number of pools.
*/
struct Application {
  scheduling::ComposerOptions                 options;
  std::shared_ptr<scheduling::PlaylistComposer> composer;
  std::shared_ptr<service::PlaylistService>     playlist_service;
};

/*
  Validates the composer section of the config and fills in defaults for
  every absent field. Throws util::InvalidConfig.
*/
scheduling::ComposerOptions BuildComposerOptions(const slideshow::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: config -> options -> composer -> service.
*/
Application Build(const slideshow::runtime::config::RuntimeConfig& config);

} // namespace slideshow::factory
