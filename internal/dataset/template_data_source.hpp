#pragma once

#include <optional>

#include "internal/model/value.hpp"
#include "internal/parameters/package_parameters.hpp"

namespace roipack::dataset {

/*
  Where template rows come from.

  Implementations:
    DirectoryDataSource → one CSV per template in a directory

  Process-edge code: failures are thrown, not returned.
*/
class TemplateDataSource {
 public:
  virtual ~TemplateDataSource() = default;

  // Only templates the source actually holds are present in the result.
  virtual model::TemplateDataset LoadTemplates() const = 0;

  // Partial parameters supplied alongside the data, if any.
  virtual std::optional<parameters::PartialPackageParameters> LoadParameterOverrides() const = 0;
};

} // namespace roipack::dataset
