#pragma once

#include <filesystem>

#include "internal/dataset/template_data_source.hpp"

namespace roipack::dataset {

/*
  Reads <root>/b_01.01.csv ... <root>/b_99.01.csv and an optional
  <root>/parameters.csv. Missing template files are simply absent from the
  dataset; a file with only a header row yields an empty template.
*/
class DirectoryDataSource final : public TemplateDataSource {
 public:
  // Throws util::NotFound if root is not a directory.
  explicit DirectoryDataSource(std::filesystem::path root);

  model::TemplateDataset LoadTemplates() const override;

  std::optional<parameters::PartialPackageParameters> LoadParameterOverrides() const override;

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace roipack::dataset
