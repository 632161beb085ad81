#pragma once

#include <cstdint>
#include <string>

namespace walship::db::model {

// `data` holds a serialized walship.core.v1.Frame.
struct FrameRecord {
  std::string database;
  uint64_t    generation   = 0;
  uint64_t    txid         = 0;
  int64_t     timestamp_ms = 0;
  std::string data;
};

}
