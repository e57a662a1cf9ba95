#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/feed_entry_record.hpp"

namespace gemfeed::store {

/*
  ViewTracker

  Per-user read state. A view row goes away with its user or its entry,
  so asking about a deleted entry is NotFound rather than false.
*/

class ViewTracker {
 public:
  explicit ViewTracker(db::Repository& repository);

  // true when newly marked
  bool MarkViewed(int64_t user_id, int64_t entry_id);
  bool IsViewed(int64_t user_id, int64_t entry_id);

  // Entries of subscribed feeds not yet viewed, by (published_at, id).
  std::vector<db::model::FeedEntryRecord> ListUnviewedEntries(int64_t user_id);

 private:
  void RequireUserAndEntry(db::Transaction& tx, int64_t user_id, int64_t entry_id);

  db::Repository& repository_;
};

} // namespace gemfeed::store
