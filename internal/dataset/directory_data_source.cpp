#include "directory_data_source.hpp"

#include "internal/csv/csv_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"

namespace roipack::dataset {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kParametersFile = "parameters.csv";

} // namespace

DirectoryDataSource::DirectoryDataSource(std::filesystem::path root) : root_(std::move(root)) {
  if (!std::filesystem::is_directory(root_)) {
    throw util::NotFound("data directory not found: " + root_.string());
  }
}

model::TemplateDataset DirectoryDataSource::LoadTemplates() const {
  model::TemplateDataset dataset;

  for (const auto id : model::kAllTemplates) {
    const auto path = root_ / model::TemplateFileName(id);
    if (!std::filesystem::exists(path)) {
      continue;
    }

    auto rows = csv::ParseCsv(util::ReadFile(path));
    ROIPACK_LOG_INFO("Loaded template data", {StringField("template", model::ToString(id)), StringField("path", path.string()),
                                              IntField("rows", static_cast<std::int64_t>(rows.size()))});
    dataset.emplace(id, std::move(rows));
  }

  return dataset;
}

std::optional<parameters::PartialPackageParameters> DirectoryDataSource::LoadParameterOverrides() const {
  const auto path = root_ / kParametersFile;
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }

  ROIPACK_LOG_INFO("Loaded parameter overrides", {StringField("path", path.string())});
  return parameters::ParseParameters(util::ReadFile(path));
}

} // namespace roipack::dataset
