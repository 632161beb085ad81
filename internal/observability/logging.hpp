#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace walship::runtime::config {
class RuntimeConfig;
}

namespace walship::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// Rendered as "<n>ms".
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

/*
  Installs the process logger. Every line carries node=<hostname> taken from
  whichever lease block (static or coordinated) is configured.
*/
void InitializeLogging(const walship::runtime::config::RuntimeConfig& config);
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

} // namespace walship::observability

#define WALSHIP_LOG_DEBUG(message, ...) ::walship::observability::LogDebug((message), ##__VA_ARGS__)
#define WALSHIP_LOG_INFO(message, ...) ::walship::observability::LogInfo((message), ##__VA_ARGS__)
#define WALSHIP_LOG_WARN(message, ...) ::walship::observability::LogWarn((message), ##__VA_ARGS__)
#define WALSHIP_LOG_ERROR(message, ...) ::walship::observability::LogError((message), ##__VA_ARGS__)
