#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace roipack::parameters {

inline constexpr std::string_view kEntityIdPrefix = "rs:";
inline constexpr std::string_view kCurrencyPrefix = "iso4217:";
inline constexpr std::size_t      kLegalIdLength  = 20;

/*
  The parameters record governing one filing. Decimals are declarative
  metadata for the regulator and are not enforced on row values.
*/
struct PackageParameters {
  std::string entity_id;
  std::string ref_period;
  std::string base_currency;
  int         decimals_integer  = 0;
  int         decimals_monetary = -3;
};

struct PartialPackageParameters {
  std::optional<std::string> entity_id;
  std::optional<std::string> ref_period;
  std::optional<std::string> base_currency;
  std::optional<int>         decimals_integer;
  std::optional<int>         decimals_monetary;
};

struct ParameterDefaults {
  // ISO 4217 code, without the iso4217: prefix
  std::string currency          = "EUR";
  int         decimals_integer  = 0;
  int         decimals_monetary = -3;
};

struct ValidationResult {
  bool                     valid = true;
  std::vector<std::string> errors;
};

// refPeriod defaults to today's UTC date when reference_date is not given.
PackageParameters BuildDefaultParameters(std::string_view entity_legal_id, const std::optional<std::string>& reference_date = std::nullopt,
                                         const ParameterDefaults& defaults = {});

PackageParameters ApplyOverrides(PackageParameters base, const PartialPackageParameters& overrides);

// Fixed six-line name,value document.
std::string SerializeParameters(const PackageParameters& params);

PartialPackageParameters ParseParameters(std::string_view text);

// Collects every violation; never throws.
ValidationResult ValidateParameters(const PackageParameters& params);

// Strips the rs: prefix; an id without it is returned unchanged.
std::string LegalIdFromEntityId(std::string_view entity_id);

bool IsLegalIdFormat(std::string_view legal_id);
bool IsCalendarDateFormat(std::string_view value);

} // namespace roipack::parameters
