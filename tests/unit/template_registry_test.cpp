#include "internal/registry/template_registry.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using roipack::model::TemplateId;
using roipack::registry::TemplateDefinition;
using roipack::registry::TemplateRegistry;

void TestDefaultRegistryCoversAllTemplatesInOrder() {
  const auto& registry = TemplateRegistry::Default();
  const auto& defs     = registry.Definitions();

  assert(defs.size() == roipack::model::kTemplateCount);
  for (std::size_t i = 0; i < defs.size(); ++i) {
    assert(defs[i].id == roipack::model::kAllTemplates[i]);
  }
  assert(&TemplateRegistry::Default() == &registry);
}

void TestDefaultColumnLayouts() {
  const auto& registry = TemplateRegistry::Default();

  const auto& entity = registry.ColumnOrder(TemplateId::kB0101);
  assert(entity.size() == 6);
  assert(entity.front() == "c0010");
  assert(entity.back() == "c0060");

  assert(registry.ColumnOrder(TemplateId::kB0202).size() == 18);
  assert(registry.ColumnOrder(TemplateId::kB0202).back() == "c0180");

  const std::vector<std::string> intra_group = {"c0010", "c0020", "c0031"};
  assert(registry.ColumnOrder(TemplateId::kB0303) == intra_group);

  assert(registry.ColumnOrder(TemplateId::kB9901).empty());
  assert(registry.Definition(TemplateId::kB0501).esa_reference == "RT.05.01");
}

void TestSequentialColumns() {
  const std::vector<std::string> expected = {"c0010", "c0020", "c0030"};
  assert(roipack::registry::SequentialColumns(3) == expected);
  assert(roipack::registry::SequentialColumns(0).empty());
  assert(roipack::registry::SequentialColumns(12).back() == "c0120");
}

void TestCustomRegistryKeepsEnumOrder() {
  auto defs = TemplateRegistry::Default().Definitions();
  std::swap(defs.front(), defs.back());
  defs[roipack::model::kTemplateCount - 1].columns = {"a", "b"};

  TemplateRegistry registry(defs);
  assert(registry.Definitions().front().id == TemplateId::kB0101);
  assert(registry.ColumnOrder(TemplateId::kB0101) == std::vector<std::string>({"a", "b"}));
}

void TestMissingDefinitionIsRejected() {
  auto defs = TemplateRegistry::Default().Definitions();
  defs.pop_back();

  bool threw = false;
  try {
    TemplateRegistry registry(defs);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "TemplateRegistry must reject a missing template.");
}

void TestDuplicateDefinitionIsRejected() {
  auto defs = TemplateRegistry::Default().Definitions();
  defs.back() = defs.front();

  bool threw = false;
  try {
    TemplateRegistry registry(defs);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "TemplateRegistry must reject duplicate templates.");
}

void TestTemplateIdStrings() {
  assert(roipack::model::ToString(TemplateId::kB0101) == "B_01.01");
  assert(roipack::model::ToString(TemplateId::kB9901) == "B_99.01");
  assert(roipack::model::TemplateFileName(TemplateId::kB0203) == "b_02.03.csv");
  assert(roipack::model::TemplateIdFromString("B_05.02") == TemplateId::kB0502);
  assert(!roipack::model::TemplateIdFromString("B_05.03").has_value());
}

} // namespace

int main() {
  TestDefaultRegistryCoversAllTemplatesInOrder();
  TestDefaultColumnLayouts();
  TestSequentialColumns();
  TestCustomRegistryKeepsEnumOrder();
  TestMissingDefinitionIsRejected();
  TestDuplicateDefinitionIsRejected();
  TestTemplateIdStrings();

  std::cout << "roipack_unit_template_registry: pass\n";
  return 0;
}
