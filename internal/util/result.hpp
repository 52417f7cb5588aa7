#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace roipack::util {

/*
  Portable result codes.

  Library layers report data problems through Status / Result<T> instead of
  throwing. The package orchestration turns the first failure into an
  ExportResult failure.
*/

enum class ErrorCode {
  OK = 0,

  InvalidArgument,
  UnrenderableValue,

  CompressionError,
  Corruption,
  IOError,

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::InvalidArgument:
      return "invalid argument";
    case ErrorCode::UnrenderableValue:
      return "unrenderable value";
    case ErrorCode::CompressionError:
      return "compression error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::InternalError:
    default:
      return "internal error";
  }
}

struct Status {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Status Ok() {
    return {};
  }

  static Status Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool ok() const {
    return code == ErrorCode::OK;
  }

  explicit operator bool() const {
    return ok();
  }

  std::string ToString() const {
    if (ok()) {
      return "ok";
    }
    std::string out(util::ToString(code));
    if (!message.empty()) {
      out += ": ";
      out += message;
    }
    return out;
  }
};

/*
  Value or failure Status. A Result built from a Status must carry an error.
*/
template <typename T>
class Result {
 public:
  Result(T value) : value_(std::move(value)) {
  }

  Result(Status status) : status_(std::move(status)) {
    if (status_.ok()) {
      status_ = Status::Err(ErrorCode::InternalError, "Result constructed from OK status without a value");
    }
  }

  bool ok() const {
    return value_.has_value();
  }

  explicit operator bool() const {
    return ok();
  }

  const Status& status() const {
    return status_;
  }

  const T& value() const& {
    return *value_;
  }

  T& value() & {
    return *value_;
  }

  T&& value() && {
    return std::move(*value_);
  }

  const T& operator*() const& {
    return *value_;
  }

  T& operator*() & {
    return *value_;
  }

  const T* operator->() const {
    return &*value_;
  }

  T* operator->() {
    return &*value_;
  }

 private:
  Status           status_;
  std::optional<T> value_;
};

} // namespace roipack::util

#define ROIPACK_CONCAT_IMPL(a, b) a##b
#define ROIPACK_CONCAT(a, b)      ROIPACK_CONCAT_IMPL(a, b)

#define ROIPACK_RETURN_NOT_OK(expr)                 \
  do {                                              \
    ::roipack::util::Status _roipack_status = (expr); \
    if (!_roipack_status.ok()) {                    \
      return _roipack_status;                       \
    }                                               \
  } while (false)

#define ROIPACK_ASSIGN_OR_RETURN_IMPL(tmp, lhs, expr) \
  auto tmp = (expr);                                  \
  if (!tmp.ok()) {                                    \
    return tmp.status();                              \
  }                                                   \
  lhs = std::move(tmp).value()

#define ROIPACK_ASSIGN_OR_RETURN(lhs, expr) ROIPACK_ASSIGN_OR_RETURN_IMPL(ROIPACK_CONCAT(_roipack_result_, __LINE__), lhs, expr)
