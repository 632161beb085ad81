#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace walship::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Environment references
  ($VAR, ${VAR}) are expanded in the raw text before parsing unless disabled.
*/
class ConfigLoader {
 public:
  static walship::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path, bool expand_env = true);

  static walship::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text, bool expand_env = true);

  // Reads `path` if given, otherwise the first existing file of SearchPaths().
  // Returns the parsed config and records the file that was used.
  static walship::runtime::config::RuntimeConfig Load(const std::optional<std::string>& path, bool expand_env, std::string* used_path = nullptr);

  // ./walship.yml, $HOME/walship.yml, /etc/walship.yml
  static std::vector<std::string> SearchPaths();

  // Fills every unset field with its default.
  static void ApplyDefaults(walship::runtime::config::RuntimeConfig& config);
};

// Expands $VAR and ${VAR}; unset variables expand to the empty string.
std::string ExpandEnv(const std::string& text);

} // namespace walship::config
