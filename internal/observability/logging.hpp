#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace roipack::runtime::config {
class RuntimeConfig;
}

namespace roipack::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const roipack::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Before InitializeLogging this goes to spdlog's default logger.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace roipack::observability

#define ROIPACK_LOG_INFO(message, ...) ::roipack::observability::LogInfo((message), ##__VA_ARGS__)
#define ROIPACK_LOG_WARN(message, ...) ::roipack::observability::LogWarn((message), ##__VA_ARGS__)
#define ROIPACK_LOG_ERROR(message, ...) ::roipack::observability::LogError((message), ##__VA_ARGS__)
