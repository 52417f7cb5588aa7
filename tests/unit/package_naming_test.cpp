#include "internal/package/package_naming.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

namespace {

using roipack::util::TimePoint;

TimePoint FromMillis(long long ms) {
  return TimePoint(std::chrono::milliseconds(ms));
}

roipack::parameters::PackageParameters Parameters() {
  roipack::parameters::PackageParameters params;
  params.entity_id     = "rs:529900T8BM49AURSDO55";
  params.ref_period    = "2024-12-31";
  params.base_currency = "iso4217:EUR";
  return params;
}

bool IsDigits(const std::string& value) {
  for (char c : value) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

void TestTimestampTokenIsSeventeenDigits() {
  // 2025-01-15T10:30:00.123Z
  const auto token = roipack::package::TimestampToken(FromMillis(1736937000123LL));
  assert(token == "20250115103000123");
  assert(token.size() == roipack::package::kTimestampDigits);
}

void TestFolderName() {
  const auto folder = roipack::package::PackageFolderName(Parameters(), FromMillis(1736937000123LL));
  assert(folder == "529900T8BM49AURSDO55.CON_FR_DORA010100_DORA_2024-12-31_20250115103000123");
}

void TestFolderMatchesFilingPattern() {
  const auto folder = roipack::package::PackageFolderName(Parameters(), roipack::util::Now());

  // ^[A-Z0-9]{20}\.CON_FR_DORA010100_DORA_\d{4}-\d{2}-\d{2}_\d{17}$
  const std::string infix = ".CON_FR_DORA010100_DORA_";
  assert(folder.size() == 20 + infix.size() + 10 + 1 + 17);
  assert(roipack::parameters::IsLegalIdFormat(folder.substr(0, 20)));
  assert(folder.substr(20, infix.size()) == infix);
  assert(roipack::parameters::IsCalendarDateFormat(folder.substr(20 + infix.size(), 10)));
  assert(folder[20 + infix.size() + 10] == '_');
  assert(IsDigits(folder.substr(folder.size() - 17)));
}

void TestEntityIdWithoutPrefixIsUsedAsIs() {
  auto params      = Parameters();
  params.entity_id = "5493001KJTIIGC8Y1R12";
  const auto folder = roipack::package::PackageFolderName(params, FromMillis(0));
  assert(folder == "5493001KJTIIGC8Y1R12.CON_FR_DORA010100_DORA_2024-12-31_19700101000000000");
}

void TestArchiveFileName() {
  assert(roipack::package::ArchiveFileName("folder") == "folder.zip");
}

} // namespace

int main() {
  TestTimestampTokenIsSeventeenDigits();
  TestFolderName();
  TestFolderMatchesFilingPattern();
  TestEntityIdWithoutPrefixIsUsedAsIs();
  TestArchiveFileName();

  std::cout << "roipack_unit_package_naming: pass\n";
  return 0;
}
