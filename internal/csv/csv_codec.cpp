#include "csv_codec.hpp"

#include <charconv>
#include <cmath>
#include <system_error>
#include <type_traits>

namespace roipack::csv {

using util::ErrorCode;
using util::Status;

namespace {

constexpr std::string_view kSpecialCharacters = ",\"\n\r";

// Scientific output from to_chars pads the exponent ("1e-07"); drop the padding.
std::string TrimExponent(std::string text) {
  const auto e = text.find('e');
  if (e == std::string::npos || e + 2 >= text.size()) {
    return text;
  }
  std::size_t digits = e + 2;
  while (digits + 1 < text.size() && text[digits] == '0') {
    text.erase(digits, 1);
  }
  return text;
}

// "1.2345e+20" -> "123450000000000000000", "-2.5e-03" -> "-0.0025"
std::string ExpandScientific(std::string_view text) {
  std::string out;
  if (!text.empty() && text.front() == '-') {
    out.push_back('-');
    text.remove_prefix(1);
  }

  const auto  e        = text.find('e');
  const auto  mantissa = text.substr(0, e);
  auto        exponent = text.substr(e + 1);
  const bool  negative = !exponent.empty() && exponent.front() == '-';
  if (!exponent.empty() && (exponent.front() == '-' || exponent.front() == '+')) {
    exponent.remove_prefix(1);
  }
  int magnitude = 0;
  std::from_chars(exponent.data(), exponent.data() + exponent.size(), magnitude);

  std::string digits;
  for (char c : mantissa) {
    if (c != '.') {
      digits.push_back(c);
    }
  }

  // Position of the decimal point relative to the first digit.
  const int point = (negative ? -magnitude : magnitude) + 1;
  const int count = static_cast<int>(digits.size());

  if (point >= count) {
    out += digits;
    out.append(static_cast<std::size_t>(point - count), '0');
  } else if (point > 0) {
    out.append(digits, 0, static_cast<std::size_t>(point));
    out.push_back('.');
    out.append(digits, static_cast<std::size_t>(point), std::string::npos);
  } else {
    out += "0.";
    out.append(static_cast<std::size_t>(-point), '0');
    out += digits;
  }
  return out;
}

bool IsAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view TrimAsciiSpace(std::string_view text) {
  while (!text.empty() && IsAsciiSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && IsAsciiSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

bool IsBlank(std::string_view record) {
  for (char c : record) {
    if (c != ' ' && c != '\t') {
      return false;
    }
  }
  return true;
}

} // namespace

std::string EscapeField(std::string_view field) {
  if (field.find_first_of(kSpecialCharacters) == std::string_view::npos) {
    return std::string(field);
  }

  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char c : field) {
    if (c == '"') {
      out.push_back('"');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

util::Result<std::string> FormatNumber(double value) {
  if (!std::isfinite(value)) {
    return Status::Err(ErrorCode::UnrenderableValue, "non-finite number cannot be rendered");
  }
  // Also folds negative zero.
  if (value == 0.0) {
    return std::string("0");
  }

  // Shortest round-trip digits first; plain notation is expanded from them so
  // large integers pad with zeros instead of printing the exact binary value.
  char       buf[128];
  const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
  if (ec != std::errc()) {
    return Status::Err(ErrorCode::InternalError, "number formatting overflowed its buffer");
  }

  std::string text(buf, ptr);
  const auto  magnitude = std::fabs(value);
  if (magnitude >= 1e21 || magnitude < 1e-6) {
    return TrimExponent(std::move(text));
  }
  return ExpandScientific(text);
}

util::Result<std::string> FormatValue(const model::Value& value) {
  return std::visit(
      [](const auto& v) -> util::Result<std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return std::string();
        } else if constexpr (std::is_same_v<T, bool>) {
          return std::string(v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, double>) {
          return FormatNumber(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else {
          return util::ToCalendarDate(v);
        }
      },
      value);
}

util::Result<std::string> RenderCsv(const std::vector<std::string>& columns, const model::Rows& rows, const RenderOptions& options) {
  std::string out;

  if (options.include_header) {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (i > 0) {
        out.push_back(',');
      }
      out += EscapeField(columns[i]);
    }
    out.push_back('\n');
  }

  if (columns.empty()) {
    return out;
  }

  for (std::size_t r = 0; r < rows.size(); ++r) {
    const auto& row = rows[r];
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (i > 0) {
        out.push_back(',');
      }

      const auto it = row.find(columns[i]);
      if (it == row.end()) {
        continue;
      }

      auto field = FormatValue(it->second);
      if (!field.ok()) {
        return Status::Err(field.status().code, "row " + std::to_string(r) + ", column " + columns[i] + ": " + field.status().message);
      }
      out += EscapeField(*field);
    }
    out.push_back('\n');
  }

  return out;
}

std::vector<std::string> SplitFields(std::string_view record) {
  std::vector<std::string> fields;
  std::string              current;
  bool                     in_quotes = false;

  for (std::size_t i = 0; i < record.size(); ++i) {
    const char c = record[i];

    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < record.size() && record[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current.push_back(c);
      }
      continue;
    }

    if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      fields.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }

  fields.push_back(std::move(current));
  return fields;
}

std::vector<std::string_view> SplitRecords(std::string_view text) {
  std::vector<std::string_view> records;
  std::size_t                   start     = 0;
  bool                          in_quotes = false;

  auto emit = [&](std::size_t end) {
    const auto record = text.substr(start, end - start);
    if (!IsBlank(record)) {
      records.push_back(record);
    }
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '"') {
      in_quotes = !in_quotes;
    } else if (!in_quotes && (c == '\n' || c == '\r')) {
      emit(i);
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      start = i + 1;
    }
  }

  if (start < text.size()) {
    emit(text.size());
  }
  return records;
}

model::Value InferValue(std::string_view field) {
  if (field.empty()) {
    return std::monostate{};
  }
  if (field == "true") {
    return true;
  }
  if (field == "false") {
    return false;
  }

  // Surrounding whitespace and one leading '+' are accepted on numbers.
  auto numeric = TrimAsciiSpace(field);
  if (numeric.size() > 1 && numeric.front() == '+' && numeric[1] != '-' && numeric[1] != '+') {
    numeric.remove_prefix(1);
  }

  double     number = 0.0;
  const auto end    = numeric.data() + numeric.size();
  const auto [ptr, ec] = std::from_chars(numeric.data(), end, number);
  if (ec == std::errc() && ptr == end && std::isfinite(number)) {
    return number;
  }

  return std::string(field);
}

model::Rows ParseCsv(std::string_view text) {
  const auto records = SplitRecords(text);
  if (records.size() < 2) {
    return {};
  }

  const auto header = SplitFields(records.front());

  model::Rows rows;
  rows.reserve(records.size() - 1);
  for (std::size_t r = 1; r < records.size(); ++r) {
    const auto fields = SplitFields(records[r]);

    model::Row row;
    for (std::size_t i = 0; i < header.size(); ++i) {
      row[header[i]] = i < fields.size() ? InferValue(fields[i]) : model::Value{};
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

} // namespace roipack::csv
