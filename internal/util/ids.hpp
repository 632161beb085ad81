#pragma once

#include <cstdint>
#include <string>

namespace walship::util {

// Random RFC 4122 version 4 id, lowercase hex with dashes. Names one lease grant.
std::string NewLeaseId();

// Random non-zero generation. Zero is reserved for "no history".
uint64_t NewGeneration();

} // namespace walship::util
