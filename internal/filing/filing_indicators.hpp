#pragma once

#include <string>
#include <vector>

#include "internal/model/value.hpp"
#include "internal/registry/template_registry.hpp"
#include "internal/util/result.hpp"

namespace roipack::filing {

struct FilingIndicatorRow {
  model::TemplateId template_id = model::TemplateId::kB0101;
  bool              reported    = false;
};

/*
  One row per registry template, in registry order. A template is reported
  iff the dataset holds it with at least one row.
*/
std::vector<FilingIndicatorRow> DeriveFilingIndicators(const registry::TemplateRegistry& registry, const model::TemplateDataset& dataset);

// templateID,reported
util::Result<std::string> RenderFilingIndicatorsCsv(const std::vector<FilingIndicatorRow>& indicators);

} // namespace roipack::filing
