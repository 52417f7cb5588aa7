#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/value.hpp"
#include "internal/util/result.hpp"

namespace roipack::csv {

/*
  RFC-4180 flavoured CSV codec for template row data.

  Encoding is deterministic and total for every value except non-finite
  numbers. Decoding infers types heuristically and is intentionally lossy:
  "true"/"false" become booleans and numeric-looking text becomes a number.
*/

struct RenderOptions {
  bool include_header = true;
};

// Quotes the field (doubling inner quotes) iff it contains , " \n or \r.
std::string EscapeField(std::string_view field);

util::Result<std::string> FormatNumber(double value);
util::Result<std::string> FormatValue(const model::Value& value);

util::Result<std::string> RenderCsv(const std::vector<std::string>& columns, const model::Rows& rows, const RenderOptions& options = {});

// Splits one record into unescaped fields.
std::vector<std::string> SplitFields(std::string_view record);

// Splits text into records on line breaks outside quoted regions. Blank records are dropped.
std::vector<std::string_view> SplitRecords(std::string_view text);

model::Value InferValue(std::string_view field);

model::Rows ParseCsv(std::string_view text);

} // namespace roipack::csv
