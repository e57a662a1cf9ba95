#pragma once

#include <cstdint>

namespace gemfeed::db::model {

struct SubscriptionRecord {
  int64_t user_id = 0;
  int64_t feed_id = 0;
};

} // namespace gemfeed::db::model
