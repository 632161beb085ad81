#pragma once

#include <cstdint>
#include <string>

namespace walship::db::model {

struct PageRecord {
  uint32_t    pgno = 0;
  std::string data;
};

}
