#include "package_builder.hpp"

#include <exception>

#include "internal/archive/zip_writer.hpp"
#include "internal/csv/csv_codec.hpp"
#include "internal/filing/filing_indicators.hpp"
#include "internal/observability/logging.hpp"
#include "internal/package/package_naming.hpp"

namespace roipack::package {

using namespace roipack::filing::v1;
using model::TemplateId;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::string_view kReportPackageJson =
    "{\n"
    "  \"documentInfo\": {\n"
    "    \"documentType\": \"https://xbrl.org/report-package/2023\"\n"
    "  }\n"
    "}";

// Changing the package layout means bumping the taxonomy reference below.
constexpr std::string_view kReportJson =
    "{\n"
    "  \"documentInfo\": {\n"
    "    \"documentType\": \"https://xbrl.org/2021/xbrl-csv\",\n"
    "    \"extends\": [\n"
    "      \"http://www.eba.europa.eu/eu/fr/xbrl/crr/fws/dora/4.0/mod/dora.json\"\n"
    "    ]\n"
    "  }\n"
    "}";

const model::Rows& RowsFor(const model::TemplateDataset& dataset, TemplateId id) {
  static const model::Rows kEmpty;
  const auto it = dataset.find(id);
  return it == dataset.end() ? kEmpty : it->second;
}

ExportMetadata MakeMetadata(const BuilderOptions& options, util::TimePoint timestamp) {
  ExportMetadata metadata;
  metadata.set_generated_at(util::ToIso8601(timestamp));
  metadata.set_generated_by(options.generator_identity);
  metadata.set_version(options.format_version);
  return metadata;
}

} // namespace

PackageBuilder::PackageBuilder(const registry::TemplateRegistry& registry, BuilderOptions options)
    : registry_(registry), options_(std::move(options)) {
}

// ------------------------------------------------------------
// File assembly
// ------------------------------------------------------------

util::Status PackageBuilder::EmitFiles(const PackageRequest& request, util::TimePoint timestamp, const FileSink& sink) const {
  const auto folder      = PackageFolderName(request.parameters, timestamp);
  const auto meta_inf    = folder + "/META-INF";
  const auto reports_dir = folder + "/reports";

  ROIPACK_RETURN_NOT_OK(sink({meta_inf + "/reportPackage.json", std::string(kReportPackageJson)}, std::nullopt));
  ROIPACK_RETURN_NOT_OK(sink({reports_dir + "/report.json", std::string(kReportJson)}, std::nullopt));
  ROIPACK_RETURN_NOT_OK(sink({reports_dir + "/parameters.csv", parameters::SerializeParameters(request.parameters)}, std::nullopt));

  std::string indicators;
  ROIPACK_ASSIGN_OR_RETURN(indicators, filing::RenderFilingIndicatorsCsv(filing::DeriveFilingIndicators(registry_, request.template_data)));
  ROIPACK_RETURN_NOT_OK(sink({reports_dir + "/FilingIndicators.csv", std::move(indicators)}, std::nullopt));

  for (const auto& definition : registry_.Definitions()) {
    auto csv = csv::RenderCsv(definition.columns, RowsFor(request.template_data, definition.id));
    if (!csv.ok()) {
      return util::Status::Err(csv.status().code, std::string(model::ToString(definition.id)) + ": " + csv.status().message);
    }
    ROIPACK_RETURN_NOT_OK(sink({reports_dir + "/" + model::TemplateFileName(definition.id), std::move(csv).value()}, definition.id));
  }

  return util::Status::Ok();
}

util::Result<std::vector<PackageFile>> PackageBuilder::BuildPackageFiles(const PackageRequest& request) const {
  std::vector<PackageFile> files;
  files.reserve(4 + model::kTemplateCount);

  ROIPACK_RETURN_NOT_OK(EmitFiles(request, request.timestamp.value_or(util::Now()), [&files](PackageFile file, std::optional<TemplateId>) {
    files.push_back(std::move(file));
    return util::Status::Ok();
  }));

  return files;
}

// ------------------------------------------------------------
// Archive assembly
// ------------------------------------------------------------

util::Result<PackageArchive> PackageBuilder::BuildArchive(const PackageRequest& request, util::TimePoint timestamp,
                                                          const ProgressCallback* on_progress) const {
  archive::ZipOptions zip_options;
  zip_options.compression_level = options_.compression_level;
  zip_options.modified_at       = timestamp;

  archive::ZipWriter writer(zip_options);
  std::size_t        templates_done = 0;

  ROIPACK_RETURN_NOT_OK(EmitFiles(request, timestamp, [&](PackageFile file, std::optional<TemplateId> template_id) {
    ROIPACK_RETURN_NOT_OK(writer.AddFile(file.path, file.content));
    if (template_id && on_progress && *on_progress) {
      ++templates_done;
      (*on_progress)(*template_id, static_cast<double>(templates_done) / static_cast<double>(model::kTemplateCount) * 100.0);
    }
    return util::Status::Ok();
  }));

  PackageArchive result;
  ROIPACK_ASSIGN_OR_RETURN(result.bytes, writer.Finish());
  result.file_name = ArchiveFileName(PackageFolderName(request.parameters, timestamp));

  ROIPACK_LOG_INFO("Filing package assembled", {StringField("archive", result.file_name), IntField("entries", static_cast<std::int64_t>(writer.entry_count())),
                                                IntField("size_bytes", static_cast<std::int64_t>(result.bytes.size()))});
  return result;
}

util::Result<PackageArchive> PackageBuilder::BuildPackageZip(const PackageRequest& request) const {
  return BuildArchive(request, request.timestamp.value_or(util::Now()), nullptr);
}

util::Result<PackageArchive> PackageBuilder::BuildPackageWithProgress(const PackageRequest& request, const ProgressCallback& on_progress) const {
  return BuildArchive(request, request.timestamp.value_or(util::Now()), &on_progress);
}

// ------------------------------------------------------------
// Export orchestration
// ------------------------------------------------------------

ExportResult PackageBuilder::BuildRoiPackage(const PackageRequest& request, PackageArchive* archive) const {
  const auto timestamp = request.timestamp.value_or(util::Now());

  ExportResult result;
  *result.mutable_metadata() = MakeMetadata(options_, timestamp);

  std::string error;
  try {
    auto built = BuildArchive(request, timestamp, nullptr);
    if (built.ok()) {
      auto* success = result.mutable_success();
      for (const auto id : model::kAllTemplates) {
        auto* file = success->add_template_files();
        file->set_template_id(std::string(model::ToString(id)));
        file->set_file_name(model::TemplateFileName(id));
        file->set_row_count(RowsFor(request.template_data, id).size());
      }
      success->set_archive_file_name(built->file_name);
      success->set_archive_size_bytes(built->bytes.size());

      if (archive) {
        *archive = std::move(built).value();
      }
      return result;
    }
    error = built.status().ToString();
  } catch (const std::exception& e) {
    error = e.what();
  }

  ROIPACK_LOG_ERROR("Filing package export failed", {StringField("entity_id", request.parameters.entity_id), StringField("error", error)});
  result.mutable_failure()->add_errors(error);
  return result;
}

} // namespace roipack::package
