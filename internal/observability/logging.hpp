#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace labfleet::runtime::config {
class RuntimeConfig;
}

namespace labfleet::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

inline LogField NodeField(std::string_view node_name) {
  return StringField("node", node_name);
}

/*
  Logs go to stderr: stdout is reserved for the JSON run report.
*/
void InitializeLogging(const labfleet::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace labfleet::observability

#define LABFLEET_LOG_DEBUG(message, ...) ::labfleet::observability::LogDebug((message), ##__VA_ARGS__)
#define LABFLEET_LOG_INFO(message, ...) ::labfleet::observability::LogInfo((message), ##__VA_ARGS__)
#define LABFLEET_LOG_WARN(message, ...) ::labfleet::observability::LogWarn((message), ##__VA_ARGS__)
#define LABFLEET_LOG_ERROR(message, ...) ::labfleet::observability::LogError((message), ##__VA_ARGS__)
