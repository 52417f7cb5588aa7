#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/value.hpp"
#include "internal/parameters/package_parameters.hpp"

namespace roipack::filing {

struct ReadinessReport {
  bool                     ready = false;
  std::vector<std::string> issues;
  std::vector<std::string> warnings;
};

struct ExportPreview {
  std::string                              legal_id;
  std::string                              reporting_period;
  std::map<model::TemplateId, std::size_t> template_counts;
  std::size_t                              total_rows = 0;
  std::uint64_t                            estimated_csv_bytes = 0;
  std::string                              estimated_csv_size;
  std::uint64_t                            estimated_xml_bytes = 0;
  std::string                              estimated_xml_size;
};

// ISO 17442 MOD 97-10.
bool IsValidLeiChecksum(std::string_view lei);

/*
  Pre-submission checks on top of parameter validation: required templates
  must carry rows, optional ones only warn when empty.
*/
ReadinessReport CheckExportReadiness(const parameters::PackageParameters& params, const model::TemplateDataset& dataset);

ExportPreview BuildExportPreview(const parameters::PackageParameters& params, const model::TemplateDataset& dataset);

// 512 B, 4.9 KB, 1.2 MB
std::string FormatByteSize(std::uint64_t bytes);

} // namespace roipack::filing
