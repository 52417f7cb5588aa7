#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace roipack::util {

// Whole file, binary. Throws NotFound if missing, std::runtime_error on read failure.
std::string ReadFile(const std::filesystem::path& path);

/*
  Atomic write:
      write tmp → flush → rename

  Creates the parent directory when needed. Throws std::runtime_error.
*/
void WriteFileAtomic(const std::filesystem::path& path, std::string_view content);

} // namespace roipack::util
