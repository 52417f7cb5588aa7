#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/result.hpp"
#include "internal/util/time.hpp"

namespace roipack::archive {

struct ZipOptions {
  // zlib level; 9 is maximum ratio
  int compression_level = 9;

  // Stamped on every entry (UTC, DOS resolution) so equal inputs give equal bytes.
  util::TimePoint modified_at{};
};

/*
  In-memory ZIP writer.

  Entries are raw-deflated with zlib and written in insertion order with the
  path exactly as given. No directory entries, no data descriptors, no ZIP64.
*/
class ZipWriter {
 public:
  explicit ZipWriter(ZipOptions options = {});

  util::Status AddFile(const std::string& path, std::string_view content);

  // Appends the central directory and returns the archive bytes.
  util::Result<std::string> Finish();

  std::size_t entry_count() const {
    return central_.size();
  }

 private:
  struct CentralRecord {
    std::string   path;
    std::uint32_t crc32             = 0;
    std::uint32_t compressed_size   = 0;
    std::uint32_t uncompressed_size = 0;
    std::uint32_t local_offset      = 0;
  };

  ZipOptions                 options_;
  std::uint16_t              dos_time_ = 0;
  std::uint16_t              dos_date_ = 0;
  std::string                buffer_;
  std::vector<CentralRecord> central_;
  bool                       finished_ = false;
};

util::Result<std::string> Deflate(std::string_view input, int level);

std::uint32_t Crc32(std::string_view data);

} // namespace roipack::archive
