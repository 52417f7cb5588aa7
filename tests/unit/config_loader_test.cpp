#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "roipack_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaults() {
  const auto config = roipack::config::ConfigLoader::Defaults();
  assert(config.logging().level() == "info");
  assert(config.exporter().generator_identity() == "DORA Comply RoI Engine v1.0");
  assert(config.exporter().format_version() == "4.0");
  assert(config.exporter().default_currency() == "EUR");
  assert(config.exporter().decimals_integer() == 0);
  assert(config.exporter().decimals_monetary() == -3);
  assert(config.exporter().compression_level() == 9);
}

void TestFullFileIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
exporter:
  generator_identity: "Acme RoI Exporter"
  format_version: "4.0"
  default_currency: USD
  decimals_integer: 2
  decimals_monetary: -6
  compression_level: 6
  output_dir: "/tmp/roipack-out"
)");

  auto config = roipack::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.exporter().generator_identity() == "Acme RoI Exporter");
  assert(config.exporter().format_version() == "4.0");
  assert(config.exporter().default_currency() == "USD");
  assert(config.exporter().decimals_integer() == 2);
  assert(config.exporter().decimals_monetary() == -6);
  assert(config.exporter().compression_level() == 6);
  assert(config.exporter().output_dir() == "/tmp/roipack-out");
}

void TestMissingFieldsFallBackToDefaults() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(exporter:
  compression_level: 0
)");

  auto config = roipack::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.exporter().compression_level() == 0);
  assert(config.exporter().default_currency() == "EUR");
  assert(config.exporter().decimals_monetary() == -3);
  assert(config.logging().level() == "info");
}

void TestEmptyFileGivesDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = roipack::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.exporter().compression_level() == 9);
  assert(config.exporter().format_version() == "4.0");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(exporter:
  generator_identity: "line1\nline2☃"
)");

  auto config = roipack::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.exporter().generator_identity() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(exporter:
  default_currency: EUR
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)roipack::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestCompressionLevelOutOfRangeIsRejected() {
  const auto yaml_path = WriteYaml("bad_level",
                                   R"(exporter:
  compression_level: 11
)");

  bool threw = false;
  try {
    (void)roipack::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject compression levels outside 0..9.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)roipack::config::ConfigLoader::LoadFromYaml("/nonexistent/roipack.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
}

void TestFactoryMapsExporterConfig() {
  auto config = roipack::config::ConfigLoader::Defaults();
  config.mutable_exporter()->set_generator_identity("Acme RoI Exporter");
  config.mutable_exporter()->set_default_currency("USD");
  config.mutable_exporter()->set_compression_level(3);
  config.mutable_exporter()->set_output_dir("");

  const auto app = roipack::factory::Build(config);
  assert(app.registry == &roipack::registry::TemplateRegistry::Default());
  assert(app.builder->options().generator_identity == "Acme RoI Exporter");
  assert(app.builder->options().compression_level == 3);
  assert(app.parameter_defaults.currency == "USD");
  assert(app.parameter_defaults.decimals_monetary == -3);
  assert(app.output_dir == ".");
}

} // namespace

int main() {
  TestDefaults();
  TestFullFileIsLoaded();
  TestMissingFieldsFallBackToDefaults();
  TestEmptyFileGivesDefaults();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestCompressionLevelOutOfRangeIsRejected();
  TestMissingFileIsRejected();
  TestFactoryMapsExporterConfig();

  std::cout << "roipack_unit_config_loader: pass\n";
  return 0;
}
