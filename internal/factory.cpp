#include "factory.hpp"

namespace roipack::factory {

package::BuilderOptions BuilderOptionsFromConfig(const roipack::runtime::config::RuntimeConfig& config) {
  const auto& exporter = config.exporter();

  package::BuilderOptions options;
  if (!exporter.generator_identity().empty()) {
    options.generator_identity = exporter.generator_identity();
  }
  if (!exporter.format_version().empty()) {
    options.format_version = exporter.format_version();
  }
  if (exporter.has_compression_level()) {
    options.compression_level = exporter.compression_level();
  }
  return options;
}

parameters::ParameterDefaults ParameterDefaultsFromConfig(const roipack::runtime::config::RuntimeConfig& config) {
  const auto& exporter = config.exporter();

  parameters::ParameterDefaults defaults;
  if (!exporter.default_currency().empty()) {
    defaults.currency = exporter.default_currency();
  }
  if (exporter.has_decimals_integer()) {
    defaults.decimals_integer = exporter.decimals_integer();
  }
  if (exporter.has_decimals_monetary()) {
    defaults.decimals_monetary = exporter.decimals_monetary();
  }
  return defaults;
}

Application Build(const roipack::runtime::config::RuntimeConfig& config) {
  Application app;

  app.registry           = &registry::TemplateRegistry::Default();
  app.builder            = std::make_shared<package::PackageBuilder>(*app.registry, BuilderOptionsFromConfig(config));
  app.parameter_defaults = ParameterDefaultsFromConfig(config);
  app.output_dir         = config.exporter().output_dir().empty() ? "." : config.exporter().output_dir();

  return app;
}

} // namespace roipack::factory
