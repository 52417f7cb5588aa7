#include "package_naming.hpp"

namespace roipack::package {

std::string TimestampToken(util::TimePoint tp) {
  std::string token;
  for (char c : util::ToIso8601(tp)) {
    if (c == '-' || c == 'T' || c == ':' || c == '.' || c == 'Z') {
      continue;
    }
    token.push_back(c);
  }

  token.resize(kTimestampDigits, '0');
  return token;
}

std::string PackageFolderName(const parameters::PackageParameters& params, util::TimePoint tp) {
  std::string folder = parameters::LegalIdFromEntityId(params.entity_id);
  folder += '.';
  folder += kModuleCode;
  folder += '_';
  folder += params.ref_period;
  folder += '_';
  folder += TimestampToken(tp);
  return folder;
}

std::string ArchiveFileName(const std::string& folder) {
  return folder + ".zip";
}

} // namespace roipack::package
