#include "internal/factory.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using slideshow::config::ConfigLoader;
using slideshow::factory::BuildComposerOptions;
using slideshow::layout::ClassifierMode;
using slideshow::model::Dimensions;
using slideshow::model::ShapeCategory;

bool RejectsConfig(const std::string& yaml) {
  try {
    (void)BuildComposerOptions(ConfigLoader::LoadFromString(yaml));
  } catch (const slideshow::util::InvalidConfig&) {
    return true;
  }
  return false;
}

void TestDefaultsWithoutComposerSection() {
  const auto options = BuildComposerOptions(ConfigLoader::LoadFromString(""));

  assert(options.default_limit == 10);
  assert(options.GroupSize(ShapeCategory::kLandscape) == 1);
  assert(options.GroupSize(ShapeCategory::kPortrait) == 3);
  assert(options.GroupSize(ShapeCategory::kSquare) == 6);
  assert(options.priority.size() == 3);
  assert(options.priority[0] == ShapeCategory::kLandscape);
  assert(options.priority[1] == ShapeCategory::kPortrait);
  assert(options.priority[2] == ShapeCategory::kSquare);
  assert(options.classifier_mode == ClassifierMode::kTolerant);
  assert((options.placeholder == Dimensions{1920, 1080}));
}

void TestOverridesAreApplied() {
  const auto options = BuildComposerOptions(ConfigLoader::LoadFromString(R"(composer:
  default_limit: 4
  priority: [square, landscape]
  placeholder_width: 1080
  placeholder_height: 1080
  classifier:
    mode: strict
  mosaic:
    square_group_size: 2
)"));

  assert(options.default_limit == 4);
  assert(options.priority.size() == 2);
  assert(options.priority[0] == ShapeCategory::kSquare);
  assert(options.GroupSize(ShapeCategory::kSquare) == 2);
  assert(options.GroupSize(ShapeCategory::kPortrait) == 3);
  assert(options.classifier_mode == ClassifierMode::kStrict);
  assert((options.placeholder == Dimensions{1080, 1080}));
}

void TestInvalidComposerSettingsAreRejected() {
  assert(RejectsConfig("composer:\n  mosaic:\n    portrait_group_size: 0\n"));
  assert(RejectsConfig("composer:\n  default_limit: 0\n"));
  assert(RejectsConfig("composer:\n  priority: [landscape, hexagon]\n"));
  assert(RejectsConfig("composer:\n  priority: [square, square]\n"));
  assert(RejectsConfig("composer:\n  classifier:\n    mode: fuzzy\n"));
  assert(RejectsConfig("composer:\n  placeholder_width: 1920\n"));
  assert(RejectsConfig("composer:\n  placeholder_width: 0\n  placeholder_height: 1080\n"));
}

void TestBuildWiresService() {
  const auto app = slideshow::factory::Build(ConfigLoader::LoadFromString("composer:\n  default_limit: 2\n"));
  assert(app.composer);
  assert(app.playlist_service);
  assert(app.composer->options().default_limit == 2);
}

} // namespace

int main() {
  TestDefaultsWithoutComposerSection();
  TestOverridesAreApplied();
  TestInvalidComposerSettingsAreRejected();
  TestBuildWiresService();

  std::cout << "slideshow_unit_factory: pass\n";
  return 0;
}
