#include "package_parameters.hpp"

#include <charconv>
#include <sstream>
#include <system_error>

#include "internal/csv/csv_codec.hpp"
#include "internal/util/time.hpp"

namespace roipack::parameters {

namespace {

constexpr std::string_view kEntityIdField        = "entityID";
constexpr std::string_view kRefPeriodField       = "refPeriod";
constexpr std::string_view kBaseCurrencyField    = "baseCurrency";
constexpr std::string_view kDecimalsIntegerField = "decimalsInteger";
constexpr std::string_view kDecimalsMonetaryField = "decimalsMonetary";

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

std::optional<int> ParseInt(std::string_view text) {
  int        value = 0;
  const auto end   = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::string LegalIdFromEntityId(std::string_view entity_id) {
  if (StartsWith(entity_id, kEntityIdPrefix)) {
    entity_id.remove_prefix(kEntityIdPrefix.size());
  }
  return std::string(entity_id);
}

bool IsLegalIdFormat(std::string_view legal_id) {
  if (legal_id.size() != kLegalIdLength) {
    return false;
  }
  for (char c : legal_id) {
    if (!IsDigit(c) && !(c >= 'A' && c <= 'Z')) {
      return false;
    }
  }
  return true;
}

bool IsCalendarDateFormat(std::string_view value) {
  if (value.size() != 10) {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (i == 4 || i == 7) {
      if (value[i] != '-') {
        return false;
      }
    } else if (!IsDigit(value[i])) {
      return false;
    }
  }
  return true;
}

PackageParameters BuildDefaultParameters(std::string_view entity_legal_id, const std::optional<std::string>& reference_date,
                                         const ParameterDefaults& defaults) {
  PackageParameters params;
  params.entity_id         = std::string(kEntityIdPrefix) + std::string(entity_legal_id);
  params.ref_period        = reference_date.value_or(util::ToCalendarDate(util::Now()));
  params.base_currency     = std::string(kCurrencyPrefix) + defaults.currency;
  params.decimals_integer  = defaults.decimals_integer;
  params.decimals_monetary = defaults.decimals_monetary;
  return params;
}

PackageParameters ApplyOverrides(PackageParameters base, const PartialPackageParameters& overrides) {
  if (overrides.entity_id) base.entity_id = *overrides.entity_id;
  if (overrides.ref_period) base.ref_period = *overrides.ref_period;
  if (overrides.base_currency) base.base_currency = *overrides.base_currency;
  if (overrides.decimals_integer) base.decimals_integer = *overrides.decimals_integer;
  if (overrides.decimals_monetary) base.decimals_monetary = *overrides.decimals_monetary;
  return base;
}

std::string SerializeParameters(const PackageParameters& params) {
  std::ostringstream out;
  out << "name,value\n";
  out << kEntityIdField << ',' << params.entity_id << '\n';
  out << kRefPeriodField << ',' << params.ref_period << '\n';
  out << kBaseCurrencyField << ',' << params.base_currency << '\n';
  out << kDecimalsIntegerField << ',' << params.decimals_integer << '\n';
  out << kDecimalsMonetaryField << ',' << params.decimals_monetary << '\n';
  return out.str();
}

PartialPackageParameters ParseParameters(std::string_view text) {
  PartialPackageParameters params;

  const auto records = csv::SplitRecords(text);
  for (const auto record : records) {
    const auto fields = csv::SplitFields(record);
    if (fields.size() < 2) {
      continue;
    }

    const auto& name  = fields[0];
    const auto& value = fields[1];

    if (name == "name") {
      continue;
    }
    if (name == kEntityIdField) {
      params.entity_id = value;
    } else if (name == kRefPeriodField) {
      params.ref_period = value;
    } else if (name == kBaseCurrencyField) {
      params.base_currency = value;
    } else if (name == kDecimalsIntegerField) {
      params.decimals_integer = ParseInt(value);
    } else if (name == kDecimalsMonetaryField) {
      params.decimals_monetary = ParseInt(value);
    }
  }

  return params;
}

ValidationResult ValidateParameters(const PackageParameters& params) {
  ValidationResult result;

  if (params.entity_id.empty()) {
    result.errors.emplace_back("entityId is required");
  } else if (!StartsWith(params.entity_id, kEntityIdPrefix)) {
    result.errors.emplace_back("entityId must start with 'rs:'");
  } else if (!IsLegalIdFormat(std::string_view(params.entity_id).substr(kEntityIdPrefix.size()))) {
    result.errors.emplace_back("entityId must be 'rs:' followed by a 20-character LEI of uppercase letters and digits");
  }

  if (params.ref_period.empty()) {
    result.errors.emplace_back("refPeriod is required");
  } else if (!IsCalendarDateFormat(params.ref_period)) {
    result.errors.emplace_back("refPeriod must be in YYYY-MM-DD format");
  }

  if (params.base_currency.empty()) {
    result.errors.emplace_back("baseCurrency is required");
  } else if (!StartsWith(params.base_currency, kCurrencyPrefix)) {
    result.errors.emplace_back("baseCurrency must start with 'iso4217:'");
  }

  result.valid = result.errors.empty();
  return result;
}

} // namespace roipack::parameters
