#include "filing_indicators.hpp"

#include "internal/csv/csv_codec.hpp"

namespace roipack::filing {

std::vector<FilingIndicatorRow> DeriveFilingIndicators(const registry::TemplateRegistry& registry, const model::TemplateDataset& dataset) {
  std::vector<FilingIndicatorRow> indicators;
  indicators.reserve(registry.Definitions().size());

  for (const auto& definition : registry.Definitions()) {
    const auto it = dataset.find(definition.id);
    indicators.push_back({definition.id, it != dataset.end() && !it->second.empty()});
  }
  return indicators;
}

util::Result<std::string> RenderFilingIndicatorsCsv(const std::vector<FilingIndicatorRow>& indicators) {
  static const std::vector<std::string> kColumns = {"templateID", "reported"};

  model::Rows rows;
  rows.reserve(indicators.size());
  for (const auto& indicator : indicators) {
    model::Row row;
    row["templateID"] = std::string(model::ToString(indicator.template_id));
    row["reported"]   = indicator.reported;
    rows.push_back(std::move(row));
  }

  return csv::RenderCsv(kColumns, rows);
}

} // namespace roipack::filing
