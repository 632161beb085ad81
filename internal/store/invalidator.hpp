#pragma once

#include <string>

#include "position.hpp"

namespace walship::store {

/*
  Notified on a replica after each applied frame or snapshot so cached
  pages of `database` can be dropped. Must be idempotent; called from
  replication worker threads.
*/
class Invalidator {
 public:
  virtual ~Invalidator() = default;

  virtual void InvalidatePosition(const std::string& database, const Position& position) = 0;
};

} // namespace walship::store
