#pragma once

#include <cstdint>
#include <string>

namespace gemfeed::db::model {

struct UserRecord {
  int64_t     id = 0;
  std::string username;
};

} // namespace gemfeed::db::model
