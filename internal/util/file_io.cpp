#include "file_io.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace roipack::util {

std::string ReadFile(const std::filesystem::path& path) {
  if (!std::filesystem::is_regular_file(path)) {
    throw NotFound("file not found: " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open " + path.string());
  }

  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw std::runtime_error("failed to read " + path.string());
  }
  return content;
}

void WriteFileAtomic(const std::filesystem::path& path, std::string_view content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  auto tmp_path = path;
  tmp_path += ".tmp";

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open " + tmp_path.string() + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      throw std::runtime_error("failed to write " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, path);
}

} // namespace roipack::util
