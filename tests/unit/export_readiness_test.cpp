#include "internal/filing/export_readiness.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

namespace {

using roipack::model::Row;
using roipack::model::TemplateDataset;
using roipack::model::TemplateId;
using roipack::parameters::PackageParameters;

PackageParameters ParametersFor(const std::string& legal_id) {
  return roipack::parameters::BuildDefaultParameters(legal_id, std::string("2024-12-31"));
}

Row SomeRow() {
  Row row;
  row["c0010"] = std::string("value");
  return row;
}

TemplateDataset CompleteDataset() {
  TemplateDataset dataset;
  for (const auto id : roipack::model::kAllTemplates) {
    dataset[id].push_back(SomeRow());
  }
  return dataset;
}

bool Contains(const std::vector<std::string>& items, const std::string& item) {
  return std::find(items.begin(), items.end(), item) != items.end();
}

void TestLeiChecksum() {
  assert(roipack::filing::IsValidLeiChecksum("529900T8BM49AURSDO55"));
  assert(roipack::filing::IsValidLeiChecksum("5493001KJTIIGC8Y1R12"));
  assert(!roipack::filing::IsValidLeiChecksum("529900T8BM49AURSDO56"));
  assert(!roipack::filing::IsValidLeiChecksum("529900t8bm49aursdo55"));
  assert(!roipack::filing::IsValidLeiChecksum(""));
}

void TestCompleteDatasetIsReady() {
  const auto report = roipack::filing::CheckExportReadiness(ParametersFor("529900T8BM49AURSDO55"), CompleteDataset());
  assert(report.ready);
  assert(report.issues.empty());
  assert(report.warnings.empty());
}

void TestMissingRequiredTemplatesAreIssues() {
  auto dataset = CompleteDataset();
  dataset.erase(TemplateId::kB0101);
  dataset[TemplateId::kB0501].clear();

  const auto report = roipack::filing::CheckExportReadiness(ParametersFor("529900T8BM49AURSDO55"), dataset);
  assert(!report.ready);
  assert(Contains(report.issues, "Required template B_01.01 has no data"));
  assert(Contains(report.issues, "Required template B_05.01 has no data"));
  assert(Contains(report.issues, "No ICT providers registered. Add vendors before export."));
  assert(!Contains(report.issues, "Required template B_01.02 has no data"));
}

void TestEmptyOptionalTemplatesOnlyWarn() {
  auto dataset = CompleteDataset();
  dataset.erase(TemplateId::kB0201);
  dataset.erase(TemplateId::kB0701);
  dataset.erase(TemplateId::kB0303);

  const auto report = roipack::filing::CheckExportReadiness(ParametersFor("529900T8BM49AURSDO55"), dataset);
  assert(report.ready);
  assert(report.warnings.size() == 2);
  assert(Contains(report.warnings, "Template B_02.01 is empty"));
  assert(Contains(report.warnings, "Template B_07.01 is empty"));
}

void TestPlaceholderLeiIsAnIssue() {
  const auto report = roipack::filing::CheckExportReadiness(ParametersFor("UNKNOWN-LEI"), CompleteDataset());
  assert(!report.ready);
  assert(Contains(report.issues, "Organization LEI is not configured. Set your LEI in Organization Settings."));
}

void TestBadChecksumIsOnlyAWarning() {
  const auto report = roipack::filing::CheckExportReadiness(ParametersFor("529900T8BM49AURSDO56"), CompleteDataset());
  assert(report.ready);
  assert(Contains(report.warnings, "LEI 529900T8BM49AURSDO56 fails the ISO 17442 checksum"));
}

void TestValidationErrorsAreIssues() {
  auto params          = ParametersFor("529900T8BM49AURSDO55");
  params.base_currency = "EUR";

  const auto report = roipack::filing::CheckExportReadiness(params, CompleteDataset());
  assert(!report.ready);
  assert(Contains(report.issues, "baseCurrency must start with 'iso4217:'"));
}

void TestPreviewCountsAndEstimate() {
  TemplateDataset dataset;
  dataset[TemplateId::kB0101].push_back(SomeRow());
  dataset[TemplateId::kB0501] = {SomeRow(), SomeRow(), SomeRow()};

  const auto preview = roipack::filing::BuildExportPreview(ParametersFor("529900T8BM49AURSDO55"), dataset);
  assert(preview.legal_id == "529900T8BM49AURSDO55");
  assert(preview.reporting_period == "2024-12-31");
  assert(preview.template_counts.size() == roipack::model::kTemplateCount);
  assert(preview.template_counts.at(TemplateId::kB0501) == 3);
  assert(preview.template_counts.at(TemplateId::kB0202) == 0);
  assert(preview.total_rows == 4);
  assert(preview.estimated_csv_bytes == 4 * 200 + 5000);
  assert(preview.estimated_csv_size == "5.7 KB");
  assert(preview.estimated_xml_bytes == 4 * 200 * 3);
  assert(preview.estimated_xml_size == "2.3 KB");
}

void TestByteSizeFormatting() {
  assert(roipack::filing::FormatByteSize(512) == "512 B");
  assert(roipack::filing::FormatByteSize(5000) == "4.9 KB");
  assert(roipack::filing::FormatByteSize(3 * 1024 * 1024 / 2) == "1.5 MB");
}

} // namespace

int main() {
  TestLeiChecksum();
  TestCompleteDatasetIsReady();
  TestMissingRequiredTemplatesAreIssues();
  TestEmptyOptionalTemplatesOnlyWarn();
  TestPlaceholderLeiIsAnIssue();
  TestBadChecksumIsOnlyAWarning();
  TestValidationErrorsAreIssues();
  TestPreviewCountsAndEstimate();
  TestByteSizeFormatting();

  std::cout << "roipack_unit_export_readiness: pass\n";
  return 0;
}
