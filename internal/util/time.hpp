#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace walship::util {

/*
  Time utilities. All clock reads go through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::milliseconds;

TimePoint Now();

// Returns `fallback` when the proto duration is unset or zero.
Duration FromProto(const google::protobuf::Duration& d, Duration fallback = Duration::zero());

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace walship::util
