#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace walship::observability {
namespace {

constexpr const char* kLoggerName     = "walship";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::mutex  node_mutex;
std::string node_field;

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value && *value) return value;
  if (!configured.empty()) return configured;
  return fallback;
}

std::string NodeName(const walship::runtime::config::RuntimeConfig& config) {
  if (config.has_coordinated()) return config.coordinated().hostname();
  if (config.has_static_()) return config.static_().hostname();
  return {};
}

// Values with spaces, quotes or '=' are quoted so lines stay splittable on ' '.
void AppendValue(std::string& out, const std::string& value) {
  const bool plain = !value.empty() && value.find_first_of(" \t\"=") == std::string::npos;
  if (plain) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

std::string Render(std::string_view message, std::initializer_list<LogField> fields) {
  std::string out(message);
  {
    std::lock_guard lock(node_mutex);
    if (!node_field.empty()) {
      out += " node=";
      AppendValue(out, node_field);
    }
  }
  for (const auto& field : fields) {
    out += ' ';
    out += field.key;
    out += '=';
    AppendValue(out, field.value);
  }
  return out;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

void InitializeLogging(const walship::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(FromEnvOr("WALSHIP_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(FromEnvOr("WALSHIP_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  std::lock_guard lock(node_mutex);
  node_field = NodeName(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;
  spdlog::log(level, "{}", Render(message, fields));
}

} // namespace walship::observability
