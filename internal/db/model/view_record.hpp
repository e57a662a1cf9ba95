#pragma once

#include <cstdint>

namespace gemfeed::db::model {

// A user has read a feed entry.
struct ViewRecord {
  int64_t user_id       = 0;
  int64_t feed_entry_id = 0;
};

} // namespace gemfeed::db::model
