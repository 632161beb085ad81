#pragma once

#include <cstdint>
#include <string>

#include "walship/core/v1/types.pb.h"

namespace walship::store {

/*
  (generation, txid). The empty position (0, 0) means nothing applied.
  Positions of different generations are not comparable.
*/
struct Position {
  uint64_t generation = 0;
  uint64_t txid       = 0;

  bool IsEmpty() const {
    return generation == 0 && txid == 0;
  }

  bool operator==(const Position&) const = default;
};

std::string ToString(const Position& pos);

walship::core::v1::Position ToProto(const Position& pos);
Position                    FromProto(const walship::core::v1::Position& pos);

} // namespace walship::store
