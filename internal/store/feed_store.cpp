#include "feed_store.hpp"

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace gemfeed::store {

FeedStore::FeedStore(db::Repository& repository) : repository_(repository) {
}

int64_t FeedStore::CreateFeed(const std::string& url, const std::string& name) {
  if (url.empty()) {
    throw util::InvalidArgument("feed url must not be empty");
  }

  db::model::FeedRecord record;
  record.url  = url;
  record.name = name;

  auto tx = repository_.Begin();
  ThrowIfDbError(repository_.InsertFeed(*tx, record), "create feed " + url);
  tx->Commit();

  GEMFEED_LOG_INFO("Feed created", {observability::IntField("feed_id", record.id),
                                    observability::StringField("url", record.url)});
  return record.id;
}

db::model::FeedRecord FeedStore::GetFeed(int64_t id) {
  auto tx   = repository_.Begin();
  auto feed = repository_.GetFeed(*tx, id);
  tx->Commit();

  if (!feed) {
    throw util::NotFound("feed " + std::to_string(id));
  }
  return *feed;
}

std::vector<db::model::FeedRecord> FeedStore::ListFeeds() {
  auto tx    = repository_.Begin();
  auto feeds = repository_.ListFeeds(*tx);
  tx->Commit();
  return feeds;
}

void FeedStore::DeleteFeed(int64_t id) {
  auto tx = repository_.Begin();
  ThrowIfDbError(repository_.DeleteFeed(*tx, id), "delete feed " + std::to_string(id));
  tx->Commit();

  GEMFEED_LOG_INFO("Feed deleted", {observability::IntField("feed_id", id)});
}

} // namespace gemfeed::store
