#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace progress::runtime::config {
class RuntimeConfig;
}

namespace progress::observability {

// One key=value pair appended to a log line. Values containing spaces are quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Replaces the default logger. Safe to call more than once.
void InitializeLogging(const progress::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

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

} // namespace progress::observability

#define PROGRESS_LOG_INFO(message, ...) ::progress::observability::LogInfo((message), ##__VA_ARGS__)
#define PROGRESS_LOG_WARN(message, ...) ::progress::observability::LogWarn((message), ##__VA_ARGS__)
#define PROGRESS_LOG_ERROR(message, ...) ::progress::observability::LogError((message), ##__VA_ARGS__)
