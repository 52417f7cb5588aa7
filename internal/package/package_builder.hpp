#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/value.hpp"
#include "internal/parameters/package_parameters.hpp"
#include "internal/registry/template_registry.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"
#include "roipack/filing/v1.hpp"

namespace roipack::package {

struct PackageFile {
  std::string path;
  std::string content;
};

struct PackageRequest {
  parameters::PackageParameters parameters;
  model::TemplateDataset        template_data;

  // Wall clock when unset.
  std::optional<util::TimePoint> timestamp;
};

struct PackageArchive {
  std::string bytes;
  std::string file_name;
};

// (template, percent complete) once per template, on the calling thread.
using ProgressCallback = std::function<void(model::TemplateId, double)>;

struct BuilderOptions {
  std::string generator_identity = "DORA Comply RoI Engine v1.0";
  std::string format_version     = "4.0";
  int         compression_level  = 9;
};

/*
  PackageBuilder

  Assembles the xBRL-CSV filing package:

    {folder}/META-INF/reportPackage.json
    {folder}/reports/report.json
    {folder}/reports/parameters.csv
    {folder}/reports/FilingIndicators.csv
    {folder}/reports/b_01.01.csv ... b_99.01.csv

  All 15 template files are always written; templates without rows are
  header-only. Parameters are not validated here.

  Stateless apart from the registry reference, which must outlive the builder.
*/
class PackageBuilder {
 public:
  explicit PackageBuilder(const registry::TemplateRegistry& registry, BuilderOptions options = {});

  util::Result<std::vector<PackageFile>> BuildPackageFiles(const PackageRequest& request) const;

  util::Result<PackageArchive> BuildPackageZip(const PackageRequest& request) const;

  util::Result<PackageArchive> BuildPackageWithProgress(const PackageRequest& request, const ProgressCallback& on_progress) const;

  // Never throws. On success the archive is moved into *archive when given.
  filing::v1::ExportResult BuildRoiPackage(const PackageRequest& request, PackageArchive* archive = nullptr) const;

  const BuilderOptions& options() const {
    return options_;
  }

 private:
  using FileSink = std::function<util::Status(PackageFile file, std::optional<model::TemplateId> template_id)>;

  util::Status EmitFiles(const PackageRequest& request, util::TimePoint timestamp, const FileSink& sink) const;

  util::Result<PackageArchive> BuildArchive(const PackageRequest& request, util::TimePoint timestamp, const ProgressCallback* on_progress) const;

  const registry::TemplateRegistry& registry_;
  BuilderOptions                    options_;
};

} // namespace roipack::package
