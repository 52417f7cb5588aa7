#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/value.hpp"
#include "internal/parameters/package_parameters.hpp"
#include "internal/registry/template_registry.hpp"
#include "internal/util/time.hpp"

namespace roipack::xbrl {

/*
  XBRL-XML rendition of the register, accepted by the ESA as an alternative
  to the xBRL-CSV package.

  One context per template row and one fact per non-empty cell. The fact
  type follows the cell's Value alternative. Numbers in monetary columns
  carry the currency unit and decimals_monetary, other numbers are plain.
*/

struct XmlOptions {
  bool pretty_print = true;
};

struct XbrlInstance {
  std::string xml;
  std::string file_name;
  std::size_t template_count = 0;
  std::size_t fact_count     = 0;
};

struct XbrlPackage {
  std::string instance_xml;
  std::string taxonomy_package_xml;
  std::string file_name;
  std::string legal_id;
  std::string reporting_period;
  std::string generated_at;
  std::size_t template_count = 0;
  std::size_t fact_count     = 0;
};

struct StructureReport {
  bool                     valid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// eba_tRT0101 for B_01.01
std::string_view TemplateConcept(model::TemplateId id);

std::string EscapeXml(std::string_view value);

// c0050, c0100 and c0110
bool IsMonetaryColumn(std::string_view column);

// {legalId}_DORA_{refPeriod}_{timestamp}.xml
std::string InstanceFileName(const parameters::PackageParameters& params, util::TimePoint timestamp);

XbrlInstance GenerateXbrlInstance(const parameters::PackageParameters& params, const model::TemplateDataset& dataset,
                                  const registry::TemplateRegistry& registry, util::TimePoint timestamp, const XmlOptions& options = {});

// Instance plus the taxonomy package descriptor.
XbrlPackage GenerateXbrlPackage(const parameters::PackageParameters& params, const model::TemplateDataset& dataset,
                                const registry::TemplateRegistry& registry, util::TimePoint timestamp, const XmlOptions& options = {});

// Declaration, root element, namespaces and closing tag only. No taxonomy checks.
StructureReport ValidateXbrlStructure(std::string_view xml);

} // namespace roipack::xbrl
