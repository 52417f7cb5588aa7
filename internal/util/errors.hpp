#pragma once

#include <stdexcept>
#include <string>

namespace roipack::util {

/*
  Process-edge error types.

  Raised by config loading, data directory access and CLI argument handling;
  main() maps them to exit codes. Library code reports through Status instead.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace roipack::util
