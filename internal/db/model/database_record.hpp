#pragma once

#include <cstdint>
#include <string>

namespace walship::db::model {

struct DatabaseRecord {
  std::string name;
  uint64_t    generation = 0;
  uint64_t    txid       = 0;
  uint32_t    page_count = 0;
};

}
