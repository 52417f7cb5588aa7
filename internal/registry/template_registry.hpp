#pragma once

#include <string>
#include <vector>

#include "internal/model/template_id.hpp"

namespace roipack::registry {

struct TemplateDefinition {
  model::TemplateId        id = model::TemplateId::kB0101;
  std::string              name;
  std::string              description;
  std::string              esa_reference;
  std::vector<std::string> columns;
};

/*
  TemplateRegistry

  Immutable table with exactly one definition per TemplateId, held in
  registry order. Built once and passed by reference into the builder.
*/
class TemplateRegistry {
 public:
  // Throws std::invalid_argument if an id is missing or duplicated.
  explicit TemplateRegistry(std::vector<TemplateDefinition> definitions);

  // ESA DORA Register of Information layout.
  static const TemplateRegistry& Default();

  const TemplateDefinition&              Definition(model::TemplateId id) const;
  const std::vector<std::string>&        ColumnOrder(model::TemplateId id) const;
  const std::vector<TemplateDefinition>& Definitions() const;

 private:
  std::vector<TemplateDefinition> definitions_;
};

// c0010, c0020, ... up to count columns.
std::vector<std::string> SequentialColumns(std::size_t count);

} // namespace roipack::registry
