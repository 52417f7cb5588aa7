#include <chrono>
#include <iostream>
#include <string>

#include "internal/archive/zip_reader.hpp"
#include "internal/filing/export_readiness.hpp"
#include "internal/package/package_builder.hpp"
#include "internal/util/file_io.hpp"

namespace {

using roipack::model::Row;
using roipack::model::TemplateId;

roipack::util::TimePoint FixedTimestamp() {
  // 2025-01-15T10:30:00.000Z
  return roipack::util::TimePoint(std::chrono::milliseconds(1736937000000LL));
}

} // namespace

int main(int argc, char** argv) {
  // Output directory can be passed on the command line.
  const std::string output_dir = argc > 1 ? argv[1] : ".";

  const auto& registry = roipack::registry::TemplateRegistry::Default();

  roipack::package::PackageRequest request;
  request.parameters = roipack::parameters::BuildDefaultParameters("529900T8BM49AURSDO55", std::string("2024-12-31"));
  request.timestamp  = FixedTimestamp();

  // Minimal entity, branch and provider rows; registry columns are c0010, c0020, ...
  Row entity;
  entity["c0010"] = std::string("529900T8BM49AURSDO55");
  entity["c0020"] = std::string("Example Bank AG");
  entity["c0030"] = std::string("DE");
  request.template_data[TemplateId::kB0101].push_back(entity);

  Row maintaining_entity;
  maintaining_entity["c0010"] = std::string("529900T8BM49AURSDO55");
  maintaining_entity["c0020"] = std::string("Example Bank AG");
  request.template_data[TemplateId::kB0102].push_back(maintaining_entity);

  Row provider;
  provider["c0010"] = std::string("5493001KJTIIGC8Y1R12");
  provider["c0020"] = std::string("LEI");
  provider["c0030"] = std::string("Cloud Provider Ltd");
  provider["c0080"] = 250000.0;
  request.template_data[TemplateId::kB0501].push_back(provider);

  // Readiness first; the builder itself never re-validates.
  const auto report = roipack::filing::CheckExportReadiness(request.parameters, request.template_data);
  std::cout << "ready: " << (report.ready ? "yes" : "no") << '\n';
  for (const auto& warning : report.warnings) {
    std::cout << "  warning: " << warning << '\n';
  }

  roipack::package::PackageBuilder builder(registry);

  auto archive = builder.BuildPackageWithProgress(request, [](TemplateId id, double percent) {
    std::cout << "  " << roipack::model::ToString(id) << " " << percent << "%\n";
  });
  if (!archive.ok()) {
    std::cerr << "BuildPackageWithProgress failed: " << archive.status().ToString() << '\n';
    return 1;
  }

  const auto path = std::filesystem::path(output_dir) / archive->file_name;
  roipack::util::WriteFileAtomic(path, archive->bytes);
  std::cout << "wrote " << path.string() << " (" << archive->bytes.size() << " bytes)\n";

  // Read it back to list the package layout.
  auto entries = roipack::archive::ReadZip(archive->bytes);
  if (!entries.ok()) {
    std::cerr << "ReadZip failed: " << entries.status().ToString() << '\n';
    return 1;
  }
  for (const auto& entry : *entries) {
    std::cout << "  " << entry.path << '\n';
  }

  return 0;
}
