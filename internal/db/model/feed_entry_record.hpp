#pragma once

#include <cstdint>
#include <string>

namespace gemfeed::db::model {

/*
  One item published by a feed.

  Dedup key: (feed_id, published_at, url).
  published_at is ISO-8601 text, so string order is chronological order.
*/

struct FeedEntryRecord {
  int64_t     id      = 0;
  int64_t     feed_id = 0;
  std::string title;
  std::string published_at;
  std::string url;
};

} // namespace gemfeed::db::model
