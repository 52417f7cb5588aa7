#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/package/package_builder.hpp"
#include "internal/parameters/package_parameters.hpp"
#include "internal/registry/template_registry.hpp"

namespace roipack::factory {

/*
  Application

  Everything a CLI command needs, built once from RuntimeConfig.
  The registry is the process-wide default and outlives the builder.
*/
struct Application {
  const registry::TemplateRegistry*         registry = nullptr;
  std::shared_ptr<package::PackageBuilder> builder;
  parameters::ParameterDefaults            parameter_defaults;
  std::string                              output_dir;
};

package::BuilderOptions BuilderOptionsFromConfig(const roipack::runtime::config::RuntimeConfig& config);

parameters::ParameterDefaults ParameterDefaultsFromConfig(const roipack::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that maps configuration onto the
  exporter's option structs.
*/
Application Build(const roipack::runtime::config::RuntimeConfig& config);

} // namespace roipack::factory
