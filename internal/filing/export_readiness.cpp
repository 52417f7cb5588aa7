#include "export_readiness.hpp"

#include <array>
#include <cstdio>

namespace roipack::filing {

using model::TemplateId;

namespace {

constexpr std::array<TemplateId, 3> kRequiredTemplates = {TemplateId::kB0101, TemplateId::kB0102, TemplateId::kB0501};
constexpr std::array<TemplateId, 4> kOptionalTemplates = {TemplateId::kB0201, TemplateId::kB0202, TemplateId::kB0601, TemplateId::kB0701};

constexpr std::string_view kPlaceholderLegalId = "UNKNOWN";

// Rough CSV cost per row plus fixed package overhead.
constexpr std::uint64_t kAverageRowBytes     = 200;
constexpr std::uint64_t kPackageOverheadBytes = 5000;
// XBRL-XML runs about three times the CSV size.
constexpr std::uint64_t kXmlExpansionFactor = 3;

std::size_t RowCount(const model::TemplateDataset& dataset, TemplateId id) {
  const auto it = dataset.find(id);
  return it == dataset.end() ? 0 : it->second.size();
}

} // namespace

bool IsValidLeiChecksum(std::string_view lei) {
  if (!parameters::IsLegalIdFormat(lei)) {
    return false;
  }

  unsigned remainder = 0;
  for (char c : lei) {
    if (c >= '0' && c <= '9') {
      remainder = (remainder * 10 + static_cast<unsigned>(c - '0')) % 97;
    } else {
      remainder = (remainder * 100 + static_cast<unsigned>(c - 'A' + 10)) % 97;
    }
  }
  return remainder == 1;
}

ReadinessReport CheckExportReadiness(const parameters::PackageParameters& params, const model::TemplateDataset& dataset) {
  ReadinessReport report;

  const auto validation = parameters::ValidateParameters(params);
  report.issues         = validation.errors;

  const auto legal_id = parameters::LegalIdFromEntityId(params.entity_id);
  if (legal_id.empty() || legal_id.rfind(kPlaceholderLegalId, 0) == 0) {
    report.issues.emplace_back("Organization LEI is not configured. Set your LEI in Organization Settings.");
  } else if (parameters::IsLegalIdFormat(legal_id) && !IsValidLeiChecksum(legal_id)) {
    report.warnings.emplace_back("LEI " + legal_id + " fails the ISO 17442 checksum");
  }

  for (const auto id : kRequiredTemplates) {
    if (RowCount(dataset, id) == 0) {
      report.issues.push_back("Required template " + std::string(model::ToString(id)) + " has no data");
    }
  }

  for (const auto id : kOptionalTemplates) {
    if (RowCount(dataset, id) == 0) {
      report.warnings.push_back("Template " + std::string(model::ToString(id)) + " is empty");
    }
  }

  if (RowCount(dataset, TemplateId::kB0501) == 0) {
    report.issues.emplace_back("No ICT providers registered. Add vendors before export.");
  }

  report.ready = report.issues.empty();
  return report;
}

ExportPreview BuildExportPreview(const parameters::PackageParameters& params, const model::TemplateDataset& dataset) {
  ExportPreview preview;
  preview.legal_id         = parameters::LegalIdFromEntityId(params.entity_id);
  preview.reporting_period = params.ref_period;

  for (const auto id : model::kAllTemplates) {
    const auto count            = RowCount(dataset, id);
    preview.template_counts[id] = count;
    preview.total_rows += count;
  }

  preview.estimated_csv_bytes = preview.total_rows * kAverageRowBytes + kPackageOverheadBytes;
  preview.estimated_csv_size  = FormatByteSize(preview.estimated_csv_bytes);
  preview.estimated_xml_bytes = preview.total_rows * kAverageRowBytes * kXmlExpansionFactor;
  preview.estimated_xml_size  = FormatByteSize(preview.estimated_xml_bytes);
  return preview;
}

std::string FormatByteSize(std::uint64_t bytes) {
  char buf[32];
  if (bytes < 1024) {
    std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
  } else if (bytes < 1024 * 1024) {
    std::snprintf(buf, sizeof(buf), "%.1f KB", static_cast<double>(bytes) / 1024.0);
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
  }
  return buf;
}

} // namespace roipack::filing
