#include "internal/parameters/package_parameters.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/time.hpp"

namespace {

using roipack::parameters::PackageParameters;
using roipack::parameters::PartialPackageParameters;

PackageParameters ValidParameters() {
  PackageParameters params;
  params.entity_id     = "rs:529900T8BM49AURSDO55";
  params.ref_period    = "2024-12-31";
  params.base_currency = "iso4217:EUR";
  return params;
}

bool Contains(const std::vector<std::string>& errors, const std::string& message) {
  return std::find(errors.begin(), errors.end(), message) != errors.end();
}

void TestDefaultsFromLegalId() {
  const auto params = roipack::parameters::BuildDefaultParameters("529900T8BM49AURSDO55", std::string("2024-12-31"));
  assert(params.entity_id == "rs:529900T8BM49AURSDO55");
  assert(params.ref_period == "2024-12-31");
  assert(params.base_currency == "iso4217:EUR");
  assert(params.decimals_integer == 0);
  assert(params.decimals_monetary == -3);
}

void TestDefaultReferencePeriodIsTodayUtc() {
  const auto before = roipack::util::ToCalendarDate(roipack::util::Now());
  const auto params = roipack::parameters::BuildDefaultParameters("529900T8BM49AURSDO55");
  const auto after  = roipack::util::ToCalendarDate(roipack::util::Now());
  assert(params.ref_period == before || params.ref_period == after);
  assert(roipack::parameters::IsCalendarDateFormat(params.ref_period));
}

void TestDefaultsHonourConfiguredCurrencyAndDecimals() {
  roipack::parameters::ParameterDefaults defaults;
  defaults.currency          = "USD";
  defaults.decimals_integer  = 2;
  defaults.decimals_monetary = -6;

  const auto params = roipack::parameters::BuildDefaultParameters("529900T8BM49AURSDO55", std::string("2024-12-31"), defaults);
  assert(params.base_currency == "iso4217:USD");
  assert(params.decimals_integer == 2);
  assert(params.decimals_monetary == -6);
}

void TestOverridesReplaceOnlySuppliedFields() {
  PartialPackageParameters overrides;
  overrides.base_currency     = "iso4217:USD";
  overrides.decimals_monetary = -2;

  const auto params = roipack::parameters::ApplyOverrides(ValidParameters(), overrides);
  assert(params.entity_id == "rs:529900T8BM49AURSDO55");
  assert(params.ref_period == "2024-12-31");
  assert(params.base_currency == "iso4217:USD");
  assert(params.decimals_integer == 0);
  assert(params.decimals_monetary == -2);
}

void TestSerializeIsFixedSixLines() {
  const auto text = roipack::parameters::SerializeParameters(ValidParameters());
  assert(text ==
         "name,value\n"
         "entityID,rs:529900T8BM49AURSDO55\n"
         "refPeriod,2024-12-31\n"
         "baseCurrency,iso4217:EUR\n"
         "decimalsInteger,0\n"
         "decimalsMonetary,-3\n");
}

void TestParseRoundTripsSerializedParameters() {
  auto original              = ValidParameters();
  original.decimals_integer  = 2;
  original.decimals_monetary = -6;

  const auto parsed = roipack::parameters::ParseParameters(roipack::parameters::SerializeParameters(original));
  assert(parsed.entity_id == original.entity_id);
  assert(parsed.ref_period == original.ref_period);
  assert(parsed.base_currency == original.base_currency);
  assert(parsed.decimals_integer == 2);
  assert(parsed.decimals_monetary == -6);
}

void TestParseIgnoresUnknownNamesAndShortRows() {
  const auto parsed = roipack::parameters::ParseParameters("name,value\nunknownField,42\nlonely\nrefPeriod,2025-06-30\r\n");
  assert(!parsed.entity_id.has_value());
  assert(parsed.ref_period == std::string("2025-06-30"));
  assert(!parsed.base_currency.has_value());
}

void TestParseLeavesUnparsableIntegersUnset() {
  const auto parsed = roipack::parameters::ParseParameters("name,value\ndecimalsInteger,abc\ndecimalsMonetary,-3x\n");
  assert(!parsed.decimals_integer.has_value());
  assert(!parsed.decimals_monetary.has_value());
}

void TestValidParametersPass() {
  const auto result = roipack::parameters::ValidateParameters(ValidParameters());
  assert(result.valid);
  assert(result.errors.empty());
}

void TestThreeMalformedFieldsGiveThreeMessages() {
  PackageParameters params;
  params.entity_id     = "529900T8BM49AURSDO55";
  params.ref_period    = "31/12/2024";
  params.base_currency = "EUR";

  const auto result = roipack::parameters::ValidateParameters(params);
  assert(!result.valid);
  assert(result.errors.size() == 3);
  assert(Contains(result.errors, "entityId must start with 'rs:'"));
  assert(Contains(result.errors, "refPeriod must be in YYYY-MM-DD format"));
  assert(Contains(result.errors, "baseCurrency must start with 'iso4217:'"));
}

void TestMissingFieldsAreRequired() {
  const auto result = roipack::parameters::ValidateParameters(PackageParameters{});
  assert(result.errors.size() == 3);
  assert(Contains(result.errors, "entityId is required"));
  assert(Contains(result.errors, "refPeriod is required"));
  assert(Contains(result.errors, "baseCurrency is required"));
}

void TestLegalIdShapeIsChecked() {
  auto params      = ValidParameters();
  params.entity_id = "rs:529900t8bm49aursdo55";
  assert(roipack::parameters::ValidateParameters(params).errors.size() == 1);

  params.entity_id = "rs:TOO-SHORT";
  assert(!roipack::parameters::ValidateParameters(params).valid);
}

void TestHelpers() {
  assert(roipack::parameters::LegalIdFromEntityId("rs:529900T8BM49AURSDO55") == "529900T8BM49AURSDO55");
  assert(roipack::parameters::LegalIdFromEntityId("529900T8BM49AURSDO55") == "529900T8BM49AURSDO55");
  assert(roipack::parameters::IsLegalIdFormat("5493001KJTIIGC8Y1R12"));
  assert(!roipack::parameters::IsLegalIdFormat("5493001KJTIIGC8Y1R1"));
  assert(roipack::parameters::IsCalendarDateFormat("2024-12-31"));
  assert(!roipack::parameters::IsCalendarDateFormat("2024-1-31"));
  assert(!roipack::parameters::IsCalendarDateFormat("2024/12/31"));
}

} // namespace

int main() {
  TestDefaultsFromLegalId();
  TestDefaultReferencePeriodIsTodayUtc();
  TestDefaultsHonourConfiguredCurrencyAndDecimals();
  TestOverridesReplaceOnlySuppliedFields();
  TestSerializeIsFixedSixLines();
  TestParseRoundTripsSerializedParameters();
  TestParseIgnoresUnknownNamesAndShortRows();
  TestParseLeavesUnparsableIntegersUnset();
  TestValidParametersPass();
  TestThreeMalformedFieldsGiveThreeMessages();
  TestMissingFieldsAreRequired();
  TestLegalIdShapeIsChecked();
  TestHelpers();

  std::cout << "roipack_unit_package_parameters: pass\n";
  return 0;
}
