#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace gemfeed::db::memory {

class MemoryTransaction;

/*
  Process-local repository used by tests and the memory:// backend.

  Foreign keys and cascades are emulated inside the transaction's
  working copy, so a rolled-back delete leaves dependents intact.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  using Pair = std::pair<int64_t, int64_t>;

  struct State {
    std::map<int64_t, model::FeedRecord> feeds;
    std::map<int64_t, model::FeedEntryRecord> entries;
    std::map<int64_t, model::UserRecord> users;

    // (user_id, feed_id)
    std::set<Pair> subscriptions;
    // (user_id, feed_entry_id)
    std::set<Pair> views;

    int64_t next_feed_id = 1;
    int64_t next_entry_id = 1;
    int64_t next_user_id = 1;
  };

  static void EraseEntry(State& s, int64_t entry_id);

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
