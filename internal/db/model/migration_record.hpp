#pragma once

#include <cstdint>
#include <string>

namespace gemfeed::db::model {

struct MigrationRecord {
  int64_t     version = 0;
  std::string name;
  uint64_t    applied_at_ms = 0;
};

} // namespace gemfeed::db::model
