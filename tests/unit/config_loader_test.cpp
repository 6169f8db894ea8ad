#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using komorebi::runtime::config::OUTPUT_FORMAT_JSON;
using komorebi::runtime::config::OUTPUT_FORMAT_TEXT;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "komorebi_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: "debug"
  pattern: "[%l] %v"
output:
  format: "OUTPUT_FORMAT_JSON"
)");

  auto config = komorebi::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.output().format() == OUTPUT_FORMAT_JSON);
}

void TestMissingSectionsKeepDefaults() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(logging:
  pattern: "%v"
)");

  auto config = komorebi::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "info");
  assert(config.logging().pattern() == "%v");
  assert(config.output().format() == OUTPUT_FORMAT_TEXT);
}

void TestEmptyFileYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = komorebi::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "info");
  assert(config.output().format() == OUTPUT_FORMAT_TEXT);
}

void TestQuotedNumericScalarStaysString() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(logging:
  level: "0"
)");

  auto config = komorebi::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "0");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(logging:
  level: "info"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)komorebi::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)komorebi::config::ConfigLoader::LoadFromYaml("/nonexistent/komorebi.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestMissingSectionsKeepDefaults();
  TestEmptyFileYieldsDefaults();
  TestQuotedNumericScalarStaysString();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "komorebi_unit_config_loader: pass\n";
  return 0;
}
