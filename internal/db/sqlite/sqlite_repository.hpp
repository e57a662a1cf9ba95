#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace gemfeed::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertFeed(Transaction&, model::FeedRecord&) override;
  std::optional<model::FeedRecord> GetFeed(Transaction&, int64_t id) override;
  std::optional<model::FeedRecord> GetFeedByUrl(Transaction&, const std::string& url) override;
  std::vector<model::FeedRecord> ListFeeds(Transaction&) override;
  Result DeleteFeed(Transaction&, int64_t id) override;

  Result InsertFeedEntry(Transaction&, model::FeedEntryRecord&) override;
  std::optional<model::FeedEntryRecord> GetFeedEntry(Transaction&, int64_t id) override;
  std::vector<model::FeedEntryRecord> ListFeedEntries(
      Transaction&, int64_t feed_id, const std::optional<std::string>& published_after) override;
  Result DeleteFeedEntry(Transaction&, int64_t id) override;

  Result InsertUser(Transaction&, model::UserRecord&) override;
  std::optional<model::UserRecord> GetUser(Transaction&, int64_t id) override;
  std::optional<model::UserRecord> GetUserByName(Transaction&, const std::string& username) override;
  std::vector<model::UserRecord> ListUsers(Transaction&) override;
  Result DeleteUser(Transaction&, int64_t id) override;

  Result InsertSubscription(Transaction&, const model::SubscriptionRecord&) override;
  Result DeleteSubscription(Transaction&, const model::SubscriptionRecord&) override;
  std::vector<model::FeedRecord> ListSubscribedFeeds(Transaction&, int64_t user_id) override;

  Result InsertView(Transaction&, const model::ViewRecord&) override;
  bool HasView(Transaction&, const model::ViewRecord&) override;
  std::vector<model::FeedEntryRecord> ListUnviewedEntries(Transaction&, int64_t user_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
