#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/archive/zip_reader.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/csv/csv_codec.hpp"
#include "internal/dataset/directory_data_source.hpp"
#include "internal/factory.hpp"
#include "internal/parameters/package_parameters.hpp"
#include "internal/util/file_io.hpp"

namespace {

using roipack::model::Row;
using roipack::model::TemplateId;
using roipack::model::Value;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "roipack_round_trip_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

/*
  Writes template CSVs to disk, loads them through the data source, builds
  the archive through the application graph, writes it out, reads it back and
  decodes the template files again.
*/
void TestDirectoryToArchiveAndBack() {
  const auto input_dir  = FreshDir("input");
  const auto output_dir = FreshDir("output");

  const auto& registry = roipack::registry::TemplateRegistry::Default();

  Row provider;
  provider["c0010"] = std::string("5493001KJTIIGC8Y1R12");
  provider["c0020"] = std::string("Cloud Provider, Ltd");
  provider["c0030"] = true;
  provider["c0040"] = Value{};

  auto provider_csv = roipack::csv::RenderCsv(registry.ColumnOrder(TemplateId::kB0501), {provider});
  assert(provider_csv.ok());
  roipack::util::WriteFileAtomic(input_dir / "b_05.01.csv", *provider_csv);
  roipack::util::WriteFileAtomic(input_dir / "parameters.csv", "name,value\nrefPeriod,2024-12-31\n");

  auto app = roipack::factory::Build(roipack::config::ConfigLoader::Defaults());

  roipack::dataset::DirectoryDataSource source(input_dir);

  roipack::package::PackageRequest request;
  request.parameters    = roipack::parameters::ApplyOverrides(roipack::parameters::BuildDefaultParameters("529900T8BM49AURSDO55", std::nullopt,
                                                                                                          app.parameter_defaults),
                                                              *source.LoadParameterOverrides());
  request.template_data = source.LoadTemplates();
  request.timestamp     = roipack::util::TimePoint(std::chrono::milliseconds(1736937000000LL));

  assert(roipack::parameters::ValidateParameters(request.parameters).valid);

  roipack::package::PackageArchive archive;
  const auto                       result = app.builder->BuildRoiPackage(request, &archive);
  assert(result.has_success());

  const auto archive_path = output_dir / archive.file_name;
  roipack::util::WriteFileAtomic(archive_path, archive.bytes);
  assert(std::filesystem::file_size(archive_path) == result.success().archive_size_bytes());

  const auto entries = roipack::archive::ReadZip(roipack::util::ReadFile(archive_path));
  assert(entries.ok());
  assert(entries->size() == 4 + roipack::model::kTemplateCount);

  const std::string folder = "529900T8BM49AURSDO55.CON_FR_DORA010100_DORA_2024-12-31_20250115103000000";
  assert(archive.file_name == folder + ".zip");

  for (const auto& entry : *entries) {
    assert(entry.path.rfind(folder + "/", 0) == 0);

    if (entry.path == folder + "/reports/b_05.01.csv") {
      const auto rows = roipack::csv::ParseCsv(entry.content);
      assert(rows.size() == 1);
      assert(rows[0].at("c0020") == Value(std::string("Cloud Provider, Ltd")));
      assert(rows[0].at("c0030") == Value(true));
      assert(roipack::model::IsNull(rows[0].at("c0040")));
    }

    if (entry.path == folder + "/reports/parameters.csv") {
      const auto parsed = roipack::parameters::ParseParameters(entry.content);
      assert(parsed.entity_id == std::string("rs:529900T8BM49AURSDO55"));
      assert(parsed.ref_period == std::string("2024-12-31"));
    }

    if (entry.path == folder + "/reports/FilingIndicators.csv") {
      assert(entry.content.find("B_05.01,true\n") != std::string::npos);
      assert(entry.content.find("B_01.01,false\n") != std::string::npos);
    }
  }
}

} // namespace

int main() {
  TestDirectoryToArchiveAndBack();

  std::cout << "roipack_integration_package_round_trip: pass\n";
  return 0;
}
