#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace walship::config {

using walship::runtime::config::RuntimeConfig;
using walship::util::ConfigError;

namespace {

constexpr const char* kConfigFileName   = "walship.yml";
constexpr const char* kDefaultBind      = "0.0.0.0:20202";
constexpr const char* kDefaultLeaseKey  = "walship/primary";
constexpr const char* kDefaultDbFile    = "walship.db";
constexpr int64_t     kDefaultTtlSec    = 10;
constexpr int64_t     kDefaultDelaySec  = 5;
constexpr int64_t     kRetentionSec     = 10 * 60;
constexpr int64_t     kMonitorSec       = 60;
constexpr int64_t     kHeartbeatSec     = 1;
constexpr int64_t     kPollSec          = 1;
constexpr int32_t     kBackoffMinNanos  = 100'000'000;
constexpr int64_t     kBackoffMaxSec    = 5;
constexpr uint32_t    kDefaultMaxBatch  = 64;
constexpr int64_t     kSqliteBusySec    = 5;
constexpr const char* kDefaultSync      = "FULL";

void SetDuration(google::protobuf::Duration* d, int64_t seconds, int32_t nanos = 0) {
  d->set_seconds(seconds);
  d->set_nanos(nanos);
}

bool IsUnset(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

bool IsVarChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigError("Unsupported YAML node");
  }
}

std::string ExpandEnv(const std::string& text) {
  std::string out;
  out.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '$' || i + 1 >= text.size()) {
      out += text[i];
      continue;
    }

    std::string name;
    size_t      end = i + 1;
    if (text[end] == '{') {
      const auto close = text.find('}', end + 1);
      if (close == std::string::npos) {
        out += text[i];
        continue;
      }
      name = text.substr(end + 1, close - end - 1);
      end  = close + 1;
    } else {
      while (end < text.size() && IsVarChar(text[end])) {
        ++end;
      }
      name = text.substr(i + 1, end - i - 1);
    }

    if (name.empty()) {
      out += text[i];
      continue;
    }

    if (const char* value = std::getenv(name.c_str())) {
      out += value;
    }
    i = end - 1;
  }
  return out;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text, bool expand_env) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(expand_env ? ExpandEnv(yaml_text) : yaml_text);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path, bool expand_env) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Failed to open config file: " + path);
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return LoadFromString(buffer.str(), expand_env);
}

std::vector<std::string> ConfigLoader::SearchPaths() {
  std::vector<std::string> paths{kConfigFileName};
  if (const char* home = std::getenv("HOME"); home && *home) {
    paths.push_back((std::filesystem::path(home) / kConfigFileName).string());
  }
  paths.push_back(std::string("/etc/") + kConfigFileName);
  return paths;
}

RuntimeConfig ConfigLoader::Load(const std::optional<std::string>& path, bool expand_env, std::string* used_path) {
  // explicit path: report any error
  if (path.has_value()) {
    auto config = LoadFromYaml(*path, expand_env);
    if (used_path) *used_path = *path;
    return config;
  }

  for (const auto& candidate : SearchPaths()) {
    std::error_code ec;
    const auto      absolute = std::filesystem::absolute(candidate, ec);
    if (ec) {
      throw ConfigError("Cannot resolve config path " + candidate + ": " + ec.message());
    }
    if (!std::filesystem::exists(absolute, ec)) {
      continue;
    }

    auto config = LoadFromYaml(absolute.string(), expand_env);
    if (used_path) *used_path = absolute.string();
    return config;
  }

  throw ConfigError("config file not found");
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (!config.has_candidate()) {
    config.set_candidate(true);
  }

  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBind);
  }

  if (config.has_coordinated()) {
    auto* coordinated = config.mutable_coordinated();
    if (coordinated->key().empty()) {
      coordinated->set_key(kDefaultLeaseKey);
    }
    if (IsUnset(coordinated->ttl())) {
      SetDuration(coordinated->mutable_ttl(), kDefaultTtlSec);
    }
    if (IsUnset(coordinated->lock_delay())) {
      SetDuration(coordinated->mutable_lock_delay(), kDefaultDelaySec);
    }
    if (IsUnset(coordinated->renew_interval())) {
      const auto half_nanos = (coordinated->ttl().seconds() * 1'000'000'000LL + coordinated->ttl().nanos()) / 2;
      SetDuration(coordinated->mutable_renew_interval(), half_nanos / 1'000'000'000LL, static_cast<int32_t>(half_nanos % 1'000'000'000LL));
    }
    if (coordinated->backend_case() == walship::runtime::config::CoordinatedLeaseConfig::BACKEND_NOT_SET) {
      coordinated->mutable_memory();
    }
  }

  auto* retention = config.mutable_retention();
  if (IsUnset(retention->duration())) {
    SetDuration(retention->mutable_duration(), kRetentionSec);
  }
  if (IsUnset(retention->monitor_interval())) {
    SetDuration(retention->mutable_monitor_interval(), kMonitorSec);
  }

  auto* replication = config.mutable_replication();
  if (IsUnset(replication->heartbeat_interval())) {
    SetDuration(replication->mutable_heartbeat_interval(), kHeartbeatSec);
  }
  if (IsUnset(replication->poll_interval())) {
    SetDuration(replication->mutable_poll_interval(), kPollSec);
  }
  if (IsUnset(replication->reconnect_backoff_min())) {
    SetDuration(replication->mutable_reconnect_backoff_min(), 0, kBackoffMinNanos);
  }
  if (IsUnset(replication->reconnect_backoff_max())) {
    SetDuration(replication->mutable_reconnect_backoff_max(), kBackoffMaxSec);
  }
  if (replication->max_batch_frames() == 0) {
    replication->set_max_batch_frames(kDefaultMaxBatch);
  }

  if (config.storage().backend_case() == walship::runtime::config::StorageConfig::BACKEND_NOT_SET && !config.data_dir().empty()) {
    config.mutable_storage()->mutable_sqlite()->set_path((std::filesystem::path(config.data_dir()) / kDefaultDbFile).string());
  }
  if (config.storage().has_sqlite()) {
    auto* sqlite = config.mutable_storage()->mutable_sqlite();
    if (IsUnset(sqlite->busy_timeout())) {
      SetDuration(sqlite->mutable_busy_timeout(), kSqliteBusySec);
    }
    if (sqlite->synchronous().empty()) {
      sqlite->set_synchronous(kDefaultSync);
    }
  }
}

} // namespace walship::config
