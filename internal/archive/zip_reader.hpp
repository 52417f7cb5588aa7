#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/result.hpp"

namespace roipack::archive {

struct ArchiveEntry {
  std::string   path;
  std::string   content;
  std::uint32_t crc32  = 0;
  std::uint16_t method = 0;
};

/*
  Reads a single-disk, non-ZIP64 archive in central directory order.
  Stored and deflated entries are supported; CRCs are verified.
  Any structural problem is reported as Corruption.
*/
util::Result<std::vector<ArchiveEntry>> ReadZip(std::string_view archive);

util::Result<std::string> Inflate(std::string_view input, std::size_t expected_size);

} // namespace roipack::archive
