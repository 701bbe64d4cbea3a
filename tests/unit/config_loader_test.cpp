#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "slideshow_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigRoundTrips() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
composer:
  default_limit: 12
  priority: [portrait, landscape, square]
  placeholder_width: 1280
  placeholder_height: 720
  classifier:
    mode: strict
  mosaic:
    portrait_group_size: 2
    square_group_size: 4
)");

  auto config = slideshow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.composer().has_default_limit());
  assert(config.composer().default_limit() == 12);
  assert(config.composer().priority_size() == 3);
  assert(config.composer().priority(0) == "portrait");
  assert(config.composer().placeholder_width() == 1280);
  assert(config.composer().classifier().mode() == "strict");
  assert(config.composer().mosaic().portrait_group_size() == 2);
  assert(config.composer().mosaic().square_group_size() == 4);
}

void TestAbsentFieldsStayUnset() {
  auto config = slideshow::config::ConfigLoader::LoadFromString("logging:\n  level: warn\n");
  assert(config.logging().level() == "warn");
  assert(!config.has_composer());
  assert(!config.composer().has_default_limit());
}

void TestEmptyDocumentIsDefaultConfig() {
  auto config = slideshow::config::ConfigLoader::LoadFromString("");
  assert(!config.has_logging());
  assert(!config.has_composer());
}

void TestQuotedScalarsStayStrings() {
  auto config = slideshow::config::ConfigLoader::LoadFromString(R"(logging:
  level: "true"
  pattern: "1234"
)");
  assert(config.logging().level() == "true");
  assert(config.logging().pattern() == "1234");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(composer:
  default_limit: 5
  shuffle: true
)");

  bool threw = false;
  try {
    (void)slideshow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const slideshow::util::InvalidConfig&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)slideshow::config::ConfigLoader::LoadFromYaml("/nonexistent/slideshow/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigRoundTrips();
  TestAbsentFieldsStayUnset();
  TestEmptyDocumentIsDefaultConfig();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "slideshow_unit_config_loader: pass\n";
  return 0;
}
