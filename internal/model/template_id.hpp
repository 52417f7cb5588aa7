#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace roipack::model {

/*
  The closed set of Register of Information templates, in registry order.
*/
enum class TemplateId : std::uint8_t {
  kB0101 = 0,
  kB0102,
  kB0103,
  kB0201,
  kB0202,
  kB0203,
  kB0301,
  kB0302,
  kB0303,
  kB0401,
  kB0501,
  kB0502,
  kB0601,
  kB0701,
  kB9901,
};

inline constexpr std::size_t kTemplateCount = 15;

inline constexpr std::array<TemplateId, kTemplateCount> kAllTemplates = {
    TemplateId::kB0101, TemplateId::kB0102, TemplateId::kB0103, TemplateId::kB0201, TemplateId::kB0202,
    TemplateId::kB0203, TemplateId::kB0301, TemplateId::kB0302, TemplateId::kB0303, TemplateId::kB0401,
    TemplateId::kB0501, TemplateId::kB0502, TemplateId::kB0601, TemplateId::kB0701, TemplateId::kB9901,
};

constexpr std::size_t IndexOf(TemplateId id) {
  return static_cast<std::size_t>(id);
}

constexpr std::string_view ToString(TemplateId id) {
  switch (id) {
    case TemplateId::kB0101:
      return "B_01.01";
    case TemplateId::kB0102:
      return "B_01.02";
    case TemplateId::kB0103:
      return "B_01.03";
    case TemplateId::kB0201:
      return "B_02.01";
    case TemplateId::kB0202:
      return "B_02.02";
    case TemplateId::kB0203:
      return "B_02.03";
    case TemplateId::kB0301:
      return "B_03.01";
    case TemplateId::kB0302:
      return "B_03.02";
    case TemplateId::kB0303:
      return "B_03.03";
    case TemplateId::kB0401:
      return "B_04.01";
    case TemplateId::kB0501:
      return "B_05.01";
    case TemplateId::kB0502:
      return "B_05.02";
    case TemplateId::kB0601:
      return "B_06.01";
    case TemplateId::kB0701:
      return "B_07.01";
    case TemplateId::kB9901:
    default:
      return "B_99.01";
  }
}

inline std::optional<TemplateId> TemplateIdFromString(std::string_view value) {
  for (const auto id : kAllTemplates) {
    if (ToString(id) == value) {
      return id;
    }
  }
  return std::nullopt;
}

// B_01.01 -> b_01.01.csv
inline std::string TemplateFileName(TemplateId id) {
  std::string name(ToString(id));
  for (auto& c : name) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return name + ".csv";
}

} // namespace roipack::model
