#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/archive/zip_reader.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/dataset/directory_data_source.hpp"
#include "internal/factory.hpp"
#include "internal/filing/export_readiness.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/time.hpp"
#include "internal/xbrl/xml_generator.hpp"

using namespace roipack;
using observability::IntField;
using observability::StringField;

namespace {

constexpr int kExitOk      = 0;
constexpr int kExitUsage   = 1;
constexpr int kExitFailure = 2;

struct CliOptions {
  std::string                config_path;
  std::optional<std::string> ref_period;
  std::optional<std::string> output_dir;
  std::string                format = "csv";
  bool                       allow_invalid = false;
  std::vector<std::string>   positionals;
};

void Usage() {
  std::cout << "Usage:\n"
            << "  roipack [--config <file.yaml>] export <legal_id> <input_dir> [--ref-period YYYY-MM-DD] [--output <dir>] [--format csv|xml|both] [--allow-invalid]\n"
            << "  roipack [--config <file.yaml>] validate <parameters.csv>\n"
            << "  roipack [--config <file.yaml>] readiness <legal_id> <input_dir> [--ref-period YYYY-MM-DD]\n"
            << "  roipack [--config <file.yaml>] preview <legal_id> <input_dir> [--ref-period YYYY-MM-DD]\n"
            << "  roipack [--config <file.yaml>] inspect <archive.zip>\n";
}

CliOptions ParseArgs(int argc, char** argv) {
  CliOptions options;

  auto value_of = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) {
      throw util::InvalidArgument(flag + " requires a value");
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      options.config_path = value_of(i, arg);
    } else if (arg == "--ref-period") {
      options.ref_period = value_of(i, arg);
    } else if (arg == "--output") {
      options.output_dir = value_of(i, arg);
    } else if (arg == "--format") {
      options.format = value_of(i, arg);
      if (options.format != "csv" && options.format != "xml" && options.format != "both") {
        throw util::InvalidArgument("--format must be csv, xml or both");
      }
    } else if (arg == "--allow-invalid") {
      options.allow_invalid = true;
    } else if (arg.rfind("--", 0) == 0) {
      throw util::InvalidArgument("unknown option " + arg);
    } else {
      options.positionals.push_back(arg);
    }
  }

  return options;
}

void RequirePositionals(const CliOptions& options, std::size_t count) {
  if (options.positionals.size() != count) {
    throw util::InvalidArgument("'" + options.positionals.front() + "' expects " + std::to_string(count - 1) + " argument(s)");
  }
}

// Defaults, then parameters.csv from the data directory, then the command line.
parameters::PackageParameters ResolveParameters(const CliOptions& options, const std::string& legal_id, const dataset::TemplateDataSource& source,
                                                const parameters::ParameterDefaults& defaults) {
  auto params = parameters::BuildDefaultParameters(legal_id, options.ref_period, defaults);

  if (auto overrides = source.LoadParameterOverrides()) {
    params = parameters::ApplyOverrides(std::move(params), *overrides);
  }

  parameters::PartialPackageParameters cli;
  cli.entity_id = std::string(parameters::kEntityIdPrefix) + legal_id;
  cli.ref_period = options.ref_period;
  return parameters::ApplyOverrides(std::move(params), cli);
}

void PrintList(const char* heading, const std::vector<std::string>& items) {
  if (items.empty()) {
    return;
  }
  std::cout << heading << ":\n";
  for (const auto& item : items) {
    std::cout << "  - " << item << "\n";
  }
}

int ExportCsvPackage(const package::PackageRequest& request, const factory::Application& app, const std::filesystem::path& output_dir) {
  package::PackageArchive archive;
  const auto              result = app.builder->BuildRoiPackage(request, &archive);

  if (result.has_success()) {
    const auto path = output_dir / archive.file_name;
    util::WriteFileAtomic(path, archive.bytes);
    ROIPACK_LOG_INFO("Wrote filing package", {StringField("path", path.string())});
  }

  google::protobuf::util::JsonPrintOptions print_options;
  print_options.add_whitespace                = true;
  print_options.always_print_primitive_fields = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(result, &json, print_options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render export result: " + std::string(status.message()));
  }
  std::cout << json;

  return result.has_success() ? kExitOk : kExitFailure;
}

int ExportXbrlInstance(const package::PackageRequest& request, const factory::Application& app, const std::filesystem::path& output_dir) {
  const auto timestamp   = request.timestamp.value_or(util::Now());
  const auto xml_package = xbrl::GenerateXbrlPackage(request.parameters, request.template_data, *app.registry, timestamp);

  const auto structure = xbrl::ValidateXbrlStructure(xml_package.instance_xml);
  PrintList("XBRL structure errors", structure.errors);
  PrintList("XBRL structure warnings", structure.warnings);
  if (!structure.valid) {
    return kExitFailure;
  }

  const auto path = output_dir / xml_package.file_name;
  util::WriteFileAtomic(path, xml_package.instance_xml);
  ROIPACK_LOG_INFO("Wrote XBRL instance", {StringField("path", path.string()), IntField("facts", static_cast<std::int64_t>(xml_package.fact_count))});

  std::cout << path.string() << "\t" << xml_package.template_count << " templates\t" << xml_package.fact_count << " facts\n";
  return kExitOk;
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int RunExport(const CliOptions& options, const factory::Application& app) {
  RequirePositionals(options, 3);
  const auto& legal_id = options.positionals[1];

  dataset::DirectoryDataSource source(options.positionals[2]);

  package::PackageRequest request;
  request.parameters    = ResolveParameters(options, legal_id, source, app.parameter_defaults);
  request.template_data = source.LoadTemplates();

  const auto validation = parameters::ValidateParameters(request.parameters);
  if (!validation.valid) {
    PrintList("Invalid parameters", validation.errors);
    if (!options.allow_invalid) {
      return kExitUsage;
    }
    ROIPACK_LOG_WARN("Exporting with invalid parameters", {IntField("violations", static_cast<std::int64_t>(validation.errors.size()))});
  }

  const std::filesystem::path output_dir = options.output_dir.value_or(app.output_dir);

  int rc = kExitOk;
  if (options.format != "xml") {
    rc = ExportCsvPackage(request, app, output_dir);
  }
  if (rc == kExitOk && options.format != "csv") {
    rc = ExportXbrlInstance(request, app, output_dir);
  }
  return rc;
}

int RunValidate(const CliOptions& options) {
  RequirePositionals(options, 2);

  const auto parsed = parameters::ParseParameters(util::ReadFile(options.positionals[1]));
  const auto params = parameters::ApplyOverrides({}, parsed);
  const auto result = parameters::ValidateParameters(params);

  if (result.valid) {
    std::cout << "parameters are valid\n";
    return kExitOk;
  }
  PrintList("Invalid parameters", result.errors);
  return kExitUsage;
}

int RunReadiness(const CliOptions& options, const factory::Application& app) {
  RequirePositionals(options, 3);

  dataset::DirectoryDataSource source(options.positionals[2]);
  const auto params = ResolveParameters(options, options.positionals[1], source, app.parameter_defaults);
  const auto report = filing::CheckExportReadiness(params, source.LoadTemplates());

  std::cout << (report.ready ? "ready" : "not ready") << "\n";
  PrintList("Issues", report.issues);
  PrintList("Warnings", report.warnings);
  return report.ready ? kExitOk : kExitUsage;
}

int RunPreview(const CliOptions& options, const factory::Application& app) {
  RequirePositionals(options, 3);

  dataset::DirectoryDataSource source(options.positionals[2]);
  const auto params  = ResolveParameters(options, options.positionals[1], source, app.parameter_defaults);
  const auto preview = filing::BuildExportPreview(params, source.LoadTemplates());

  std::cout << "LEI:              " << preview.legal_id << "\n"
            << "Reporting period: " << preview.reporting_period << "\n";
  for (const auto& [id, count] : preview.template_counts) {
    std::cout << "  " << model::ToString(id) << "  " << count << "\n";
  }
  std::cout << "Total rows:       " << preview.total_rows << "\n"
            << "Estimated size:   " << preview.estimated_csv_size << " (csv), " << preview.estimated_xml_size << " (xml)\n";
  return kExitOk;
}

int RunInspect(const CliOptions& options) {
  RequirePositionals(options, 2);

  const auto bytes   = util::ReadFile(options.positionals[1]);
  const auto entries = archive::ReadZip(bytes);
  if (!entries.ok()) {
    std::cerr << options.positionals[1] << ": " << entries.status().ToString() << "\n";
    return kExitFailure;
  }

  for (const auto& entry : *entries) {
    std::cout << entry.content.size() << "\t" << entry.path << "\n";
  }
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  CliOptions options;
  try {
    options = ParseArgs(argc, argv);
  } catch (const util::InvalidArgument& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return kExitUsage;
  }

  if (options.positionals.empty()) {
    Usage();
    return kExitUsage;
  }

  const auto& command = options.positionals.front();

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    const auto runtime_config =
        options.config_path.empty() ? config::ConfigLoader::Defaults() : config::ConfigLoader::LoadFromYaml(options.config_path);

    observability::InitializeLogging(runtime_config);

    auto app = factory::Build(runtime_config);

    int rc = kExitUsage;
    if (command == "export") {
      rc = RunExport(options, app);
    } else if (command == "validate") {
      rc = RunValidate(options);
    } else if (command == "readiness") {
      rc = RunReadiness(options, app);
    } else if (command == "preview") {
      rc = RunPreview(options, app);
    } else if (command == "inspect") {
      rc = RunInspect(options);
    } else {
      std::cerr << "unknown command: " << command << "\n";
      Usage();
    }

    observability::ShutdownLogging();
    return rc;
  } catch (const util::InvalidArgument& e) {
    std::cerr << e.what() << "\n";
    Usage();
    observability::ShutdownLogging();
    return kExitUsage;
  } catch (const std::exception& e) {
    ROIPACK_LOG_ERROR("Fatal error", {StringField("command", command), StringField("error", e.what())});
    observability::ShutdownLogging();
    return kExitFailure;
  }
}
