#include "position.hpp"

#include <cstdio>

namespace walship::store {

std::string ToString(const Position& pos) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%016llx/%llu", static_cast<unsigned long long>(pos.generation), static_cast<unsigned long long>(pos.txid));
  return buf;
}

walship::core::v1::Position ToProto(const Position& pos) {
  walship::core::v1::Position out;
  out.set_generation(pos.generation);
  out.set_txid(pos.txid);
  return out;
}

Position FromProto(const walship::core::v1::Position& pos) {
  return {pos.generation(), pos.txid()};
}

} // namespace walship::store
