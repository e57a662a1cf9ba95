#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/feed_record.hpp"

namespace gemfeed::store {

/*
  SubscriptionManager

  (user, feed) pairs. Subscribing twice is a no-op that returns false.
  Rows go away with either endpoint.
*/

class SubscriptionManager {
 public:
  explicit SubscriptionManager(db::Repository& repository);

  bool Subscribe(int64_t user_id, int64_t feed_id);
  bool Unsubscribe(int64_t user_id, int64_t feed_id);

  std::vector<db::model::FeedRecord> ListSubscribedFeeds(int64_t user_id);

 private:
  db::Repository& repository_;
};

} // namespace gemfeed::store
