#include "feed_entry_store.hpp"

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace gemfeed::store {

namespace {

std::string CanonicalTimestamp(const std::string& text, const char* what) {
  auto canonical = util::NormalizeTimestamp(text);
  if (!canonical) {
    throw util::InvalidArgument(std::string(what) + " is not an ISO-8601 date: '" + text + "'");
  }
  return *canonical;
}

// Returns the canonical published_at.
std::string ValidateEntry(const std::string& published_at, const std::string& url) {
  if (url.empty()) {
    throw util::InvalidArgument("feed entry url must not be empty");
  }
  return CanonicalTimestamp(published_at, "feed entry published_at");
}

void RequireFeed(db::Repository& repository, db::Transaction& tx, int64_t feed_id) {
  if (!repository.GetFeed(tx, feed_id)) {
    throw util::NotFound("feed " + std::to_string(feed_id));
  }
}

// Returns true when the row is new.
bool InsertEntry(db::Repository& repository, db::Transaction& tx, db::model::FeedEntryRecord& record) {
  const auto result = repository.InsertFeedEntry(tx, record);
  if (result.code == db::ErrorCode::AlreadyExists) {
    return false;
  }
  ThrowIfDbError(result, "record entry " + record.url);
  return true;
}

} // namespace

FeedEntryStore::FeedEntryStore(db::Repository& repository) : repository_(repository) {
}

RecordResult FeedEntryStore::RecordEntry(int64_t feed_id, const std::string& title, const std::string& published_at,
                                         const std::string& url) {
  db::model::FeedEntryRecord record;
  record.feed_id      = feed_id;
  record.title        = title;
  record.published_at = ValidateEntry(published_at, url);
  record.url          = url;

  auto tx = repository_.Begin();
  RequireFeed(repository_, *tx, feed_id);
  const bool inserted = InsertEntry(repository_, *tx, record);
  tx->Commit();

  if (!inserted) {
    GEMFEED_LOG_DEBUG("Duplicate feed entry", {observability::IntField("feed_id", feed_id),
                                               observability::IntField("entry_id", record.id)});
    return {RecordStatus::kDuplicateEntry, record.id};
  }

  GEMFEED_LOG_INFO("Feed entry recorded", {observability::IntField("feed_id", feed_id),
                                           observability::IntField("entry_id", record.id),
                                           observability::StringField("url", url)});
  return {RecordStatus::kInserted, record.id};
}

std::size_t FeedEntryStore::RecordEntries(int64_t feed_id, const std::vector<EntryInput>& entries) {
  std::vector<std::string> published;
  published.reserve(entries.size());
  for (const auto& entry : entries) {
    published.push_back(ValidateEntry(entry.published_at, entry.url));
  }

  auto tx = repository_.Begin();
  RequireFeed(repository_, *tx, feed_id);

  std::size_t inserted = 0;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto&                entry = entries[i];
    db::model::FeedEntryRecord record;
    record.feed_id      = feed_id;
    record.title        = entry.title;
    record.published_at = published[i];
    record.url          = entry.url;
    if (InsertEntry(repository_, *tx, record)) {
      ++inserted;
    }
  }
  tx->Commit();

  GEMFEED_LOG_INFO("Feed entries ingested", {observability::IntField("feed_id", feed_id),
                                             observability::IntField("received", static_cast<int64_t>(entries.size())),
                                             observability::IntField("inserted", static_cast<int64_t>(inserted))});
  return inserted;
}

std::vector<db::model::FeedEntryRecord> FeedEntryStore::ListEntries(int64_t feed_id,
                                                                    const std::optional<std::string>& since) {
  std::optional<std::string> cursor;
  if (since) {
    cursor = CanonicalTimestamp(*since, "since cursor");
  }

  auto tx      = repository_.Begin();
  auto entries = repository_.ListFeedEntries(*tx, feed_id, cursor);
  tx->Commit();
  return entries;
}

void FeedEntryStore::DeleteEntry(int64_t entry_id) {
  auto tx = repository_.Begin();
  ThrowIfDbError(repository_.DeleteFeedEntry(*tx, entry_id), "delete feed entry " + std::to_string(entry_id));
  tx->Commit();

  GEMFEED_LOG_INFO("Feed entry deleted", {observability::IntField("entry_id", entry_id)});
}

} // namespace gemfeed::store
