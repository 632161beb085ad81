#pragma once

#include "config/config.pb.h"

namespace walship::config {

// Throws util::ConfigError describing the first problem found.
void Validate(const walship::runtime::config::RuntimeConfig& config);

} // namespace walship::config
