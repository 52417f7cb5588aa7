#pragma once

#include <string>

#include "internal/parameters/package_parameters.hpp"
#include "internal/util/time.hpp"

namespace roipack::package {

inline constexpr std::string_view kModuleCode     = "CON_FR_DORA010100_DORA";
inline constexpr std::size_t      kTimestampDigits = 17;

// ISO-8601 UTC with separators removed: YYYYMMDDHHMMSSmmm.
std::string TimestampToken(util::TimePoint tp);

// {legalId}.CON_FR_DORA010100_DORA_{refPeriod}_{timestamp}
std::string PackageFolderName(const parameters::PackageParameters& params, util::TimePoint tp);

std::string ArchiveFileName(const std::string& folder);

} // namespace roipack::package
