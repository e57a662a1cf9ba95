#include "view_tracker.hpp"

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace gemfeed::store {

ViewTracker::ViewTracker(db::Repository& repository) : repository_(repository) {
}

void ViewTracker::RequireUserAndEntry(db::Transaction& tx, int64_t user_id, int64_t entry_id) {
  if (!repository_.GetUser(tx, user_id)) {
    throw util::NotFound("user " + std::to_string(user_id));
  }
  if (!repository_.GetFeedEntry(tx, entry_id)) {
    throw util::NotFound("feed entry " + std::to_string(entry_id));
  }
}

bool ViewTracker::MarkViewed(int64_t user_id, int64_t entry_id) {
  auto tx = repository_.Begin();
  RequireUserAndEntry(*tx, user_id, entry_id);

  const auto result = repository_.InsertView(*tx, {user_id, entry_id});
  if (result.code == db::ErrorCode::AlreadyExists) {
    tx->Commit();
    return false;
  }
  ThrowIfDbError(result, "mark viewed");
  tx->Commit();

  GEMFEED_LOG_DEBUG("Entry viewed", {observability::IntField("user_id", user_id),
                                     observability::IntField("entry_id", entry_id)});
  return true;
}

bool ViewTracker::IsViewed(int64_t user_id, int64_t entry_id) {
  auto tx = repository_.Begin();
  RequireUserAndEntry(*tx, user_id, entry_id);
  const bool viewed = repository_.HasView(*tx, {user_id, entry_id});
  tx->Commit();
  return viewed;
}

std::vector<db::model::FeedEntryRecord> ViewTracker::ListUnviewedEntries(int64_t user_id) {
  auto tx = repository_.Begin();
  if (!repository_.GetUser(*tx, user_id)) {
    throw util::NotFound("user " + std::to_string(user_id));
  }
  auto entries = repository_.ListUnviewedEntries(*tx, user_id);
  tx->Commit();
  return entries;
}

} // namespace gemfeed::store
