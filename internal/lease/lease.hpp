#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace walship::lease {

struct Node {
  std::string hostname;
  std::string advertise_url;
  bool        candidate = false;
};

/*
  The right to be primary for one coordination key.

  expires_at is in the backend's clock. A static lease never expires
  (ttl == Duration::max()).
*/
struct Lease {
  std::string          id;
  Node                 owner;
  util::TimePoint      term_start{};
  util::Duration       ttl{};
  util::Duration       lock_delay{};
  util::TimePoint      expires_at{};

  bool Unbounded() const {
    return ttl == util::Duration::max();
  }

  bool ExpiredAt(util::TimePoint now) const {
    return !Unbounded() && expires_at <= now;
  }
};

} // namespace walship::lease
