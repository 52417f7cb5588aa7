#include "template_registry.hpp"

#include <array>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <utility>

namespace roipack::registry {

using model::TemplateId;

namespace {

TemplateDefinition Make(TemplateId id, std::string name, std::string description, std::string esa_reference, std::vector<std::string> columns) {
  TemplateDefinition def;
  def.id            = id;
  def.name          = std::move(name);
  def.description   = std::move(description);
  def.esa_reference = std::move(esa_reference);
  def.columns       = std::move(columns);
  return def;
}

std::vector<TemplateDefinition> DefaultDefinitions() {
  std::vector<TemplateDefinition> defs;
  defs.reserve(model::kTemplateCount);

  defs.push_back(Make(TemplateId::kB0101, "Entity Maintaining Register", "Information about the entity maintaining the register of information",
                      "RT.01.01", SequentialColumns(6)));
  defs.push_back(Make(TemplateId::kB0102, "Entities in Scope", "Financial entities within the scope of the register", "RT.01.02",
                      SequentialColumns(11)));
  defs.push_back(Make(TemplateId::kB0103, "Branches", "Branches of financial entities", "RT.01.03", SequentialColumns(4)));
  defs.push_back(Make(TemplateId::kB0201, "Contractual Arrangements Overview", "Overview of contractual arrangements with ICT providers", "RT.02.01",
                      SequentialColumns(5)));
  defs.push_back(Make(TemplateId::kB0202, "Contractual Arrangements Details", "Detailed information on contractual arrangements", "RT.02.02",
                      SequentialColumns(18)));
  defs.push_back(Make(TemplateId::kB0203, "Linked Arrangements", "Links between contractual arrangements", "RT.02.03", SequentialColumns(3)));
  defs.push_back(Make(TemplateId::kB0301, "Entity-Arrangement Links", "Links between entities and contractual arrangements", "RT.03.01",
                      SequentialColumns(3)));
  defs.push_back(Make(TemplateId::kB0302, "Provider-Arrangement Links", "Links between providers and contractual arrangements", "RT.03.02",
                      SequentialColumns(3)));
  // B_03.03 skips c0030 in the ESA layout.
  defs.push_back(Make(TemplateId::kB0303, "Intra-Group Provider Links", "Intra-group ICT service provider links", "RT.03.03",
                      {"c0010", "c0020", "c0031"}));
  defs.push_back(Make(TemplateId::kB0401, "Service Recipients", "Entities making use of ICT services", "RT.04.01", SequentialColumns(4)));
  defs.push_back(Make(TemplateId::kB0501, "ICT Providers", "ICT third-party service providers", "RT.05.01", SequentialColumns(12)));
  defs.push_back(Make(TemplateId::kB0502, "Subcontracting", "Subcontracting chain information", "RT.05.02", SequentialColumns(7)));
  defs.push_back(Make(TemplateId::kB0601, "Critical Functions", "Critical or important functions", "RT.06.01", SequentialColumns(10)));
  defs.push_back(Make(TemplateId::kB0701, "Exit Arrangements", "Assessment for substitutability and exit arrangements", "RT.07.01",
                      SequentialColumns(12)));
  defs.push_back(Make(TemplateId::kB9901, "Lookup Values", "ESA enumeration lookup values", "RT.99.01", {}));

  return defs;
}

} // namespace

std::vector<std::string> SequentialColumns(std::size_t count) {
  std::vector<std::string> columns;
  columns.reserve(count);
  for (std::size_t i = 1; i <= count; ++i) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "c%04zu", i * 10);
    columns.emplace_back(buf);
  }
  return columns;
}

TemplateRegistry::TemplateRegistry(std::vector<TemplateDefinition> definitions) {
  std::array<std::optional<TemplateDefinition>, model::kTemplateCount> slots;

  for (auto& def : definitions) {
    const auto index = model::IndexOf(def.id);
    if (index >= slots.size()) {
      throw std::invalid_argument("template registry: unknown template id");
    }
    if (slots[index].has_value()) {
      throw std::invalid_argument("template registry: duplicate definition for " + std::string(model::ToString(def.id)));
    }
    slots[index] = std::move(def);
  }

  definitions_.reserve(model::kTemplateCount);
  for (const auto id : model::kAllTemplates) {
    auto& slot = slots[model::IndexOf(id)];
    if (!slot.has_value()) {
      throw std::invalid_argument("template registry: missing definition for " + std::string(model::ToString(id)));
    }
    definitions_.push_back(std::move(*slot));
  }
}

const TemplateRegistry& TemplateRegistry::Default() {
  static const TemplateRegistry registry(DefaultDefinitions());
  return registry;
}

const TemplateDefinition& TemplateRegistry::Definition(TemplateId id) const {
  return definitions_.at(model::IndexOf(id));
}

const std::vector<std::string>& TemplateRegistry::ColumnOrder(TemplateId id) const {
  return Definition(id).columns;
}

const std::vector<TemplateDefinition>& TemplateRegistry::Definitions() const {
  return definitions_;
}

} // namespace roipack::registry
