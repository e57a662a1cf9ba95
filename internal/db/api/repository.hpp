#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/feed_entry_record.hpp"
#include "internal/db/model/feed_record.hpp"
#include "internal/db/model/subscription_record.hpp"
#include "internal/db/model/user_record.hpp"
#include "internal/db/model/view_record.hpp"

namespace gemfeed::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Dedup keys are enforced by the backend in the same statement
    as the insert (no read-then-write)
  - Deleting a feed, feed entry or user removes every row that
    references it before the transaction commits

  The DB is the source of truth for:
    feeds and their entries
    users
    subscriptions and read state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Feeds
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists when the url is taken.
  virtual Result InsertFeed(Transaction&, model::FeedRecord&) = 0;

  virtual std::optional<model::FeedRecord> GetFeed(Transaction&, int64_t id) = 0;

  virtual std::optional<model::FeedRecord> GetFeedByUrl(Transaction&, const std::string& url) = 0;

  virtual std::vector<model::FeedRecord> ListFeeds(Transaction&) = 0;

  // NotFound when no row was removed.
  virtual Result DeleteFeed(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Feed entries
  // ---------------------------------------------------------------------

  // Assigns record.id. On a dedup-key collision nothing is written,
  // record.id is set to the existing row and AlreadyExists is returned.
  virtual Result InsertFeedEntry(Transaction&, model::FeedEntryRecord&) = 0;

  virtual std::optional<model::FeedEntryRecord> GetFeedEntry(Transaction&, int64_t id) = 0;

  // Ordered by (published_at, id). published_after is exclusive.
  virtual std::vector<model::FeedEntryRecord> ListFeedEntries(Transaction&, int64_t feed_id,
                                                              const std::optional<std::string>& published_after) = 0;

  virtual Result DeleteFeedEntry(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Users
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists when the username is taken.
  virtual Result InsertUser(Transaction&, model::UserRecord&) = 0;

  virtual std::optional<model::UserRecord> GetUser(Transaction&, int64_t id) = 0;

  virtual std::optional<model::UserRecord> GetUserByName(Transaction&, const std::string& username) = 0;

  virtual std::vector<model::UserRecord> ListUsers(Transaction&) = 0;

  virtual Result DeleteUser(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Subscriptions
  // ---------------------------------------------------------------------

  // AlreadyExists when the pair is present (nothing written).
  virtual Result InsertSubscription(Transaction&, const model::SubscriptionRecord&) = 0;

  virtual Result DeleteSubscription(Transaction&, const model::SubscriptionRecord&) = 0;

  // Feeds joined through subscriptions, ordered by feed id.
  virtual std::vector<model::FeedRecord> ListSubscribedFeeds(Transaction&, int64_t user_id) = 0;

  // ---------------------------------------------------------------------
  // Views
  // ---------------------------------------------------------------------

  // AlreadyExists when the pair is present (nothing written).
  virtual Result InsertView(Transaction&, const model::ViewRecord&) = 0;

  virtual bool HasView(Transaction&, const model::ViewRecord&) = 0;

  // Entries of feeds the user subscribes to that the user has not viewed,
  // ordered by (published_at, id).
  virtual std::vector<model::FeedEntryRecord> ListUnviewedEntries(Transaction&, int64_t user_id) = 0;
};

} // namespace gemfeed::db
