#pragma once

#include <cstdint>
#include <string>

namespace gemfeed::db::model {

/*
  Polled source.

  url is unique across the table; name is a display label
  and may be empty.
*/

struct FeedRecord {
  int64_t     id = 0;
  std::string url;
  std::string name;
};

} // namespace gemfeed::db::model
