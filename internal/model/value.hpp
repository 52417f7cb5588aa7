#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "internal/model/template_id.hpp"
#include "internal/util/time.hpp"

namespace roipack::model {

/*
  Cell value of a template row.

  monostate is null. Dates are UTC instants; only the calendar date is
  rendered.
*/
using Date  = util::TimePoint;
using Value = std::variant<std::monostate, bool, double, std::string, Date>;

using Row  = std::unordered_map<std::string, Value>;
using Rows = std::vector<Row>;

// A template may be absent or present with zero rows; both count as not reported.
using TemplateDataset = std::map<TemplateId, Rows>;

inline bool IsNull(const Value& value) {
  return std::holds_alternative<std::monostate>(value);
}

} // namespace roipack::model
