#include "pg_repository.hpp"

namespace gemfeed::db::postgres {

namespace {

model::FeedRecord ReadFeed(const pqxx::row& row) {
  model::FeedRecord r;
  r.id   = row[0].as<int64_t>();
  r.url  = row[1].c_str();
  r.name = row[2].c_str();
  return r;
}

model::FeedEntryRecord ReadFeedEntry(const pqxx::row& row) {
  model::FeedEntryRecord r;
  r.id           = row[0].as<int64_t>();
  r.feed_id      = row[1].as<int64_t>();
  r.title        = row[2].c_str();
  r.published_at = row[3].c_str();
  r.url          = row[4].c_str();
  return r;
}

model::UserRecord ReadUser(const pqxx::row& row) {
  model::UserRecord r;
  r.id       = row[0].as<int64_t>();
  r.username = row[1].c_str();
  return r;
}

std::vector<model::FeedRecord> ReadFeeds(const pqxx::result& res) {
  std::vector<model::FeedRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadFeed(row));
  }
  return out;
}

std::vector<model::FeedEntryRecord> ReadFeedEntries(const pqxx::result& res) {
  std::vector<model::FeedEntryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadFeedEntry(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e))
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e))
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Feeds
// ------------------------------------------------------------------

Result PgRepository::InsertFeed(Transaction& t, model::FeedRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_feed", r.url, r.name);
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FeedRecord> PgRepository::GetFeed(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_feed", id);
  if (res.empty()) return std::nullopt;
  return ReadFeed(res[0]);
}

std::optional<model::FeedRecord> PgRepository::GetFeedByUrl(Transaction& t, const std::string& url) {
  auto res = TX(t).Work().exec_prepared("get_feed_by_url", url);
  if (res.empty()) return std::nullopt;
  return ReadFeed(res[0]);
}

std::vector<model::FeedRecord> PgRepository::ListFeeds(Transaction& t) {
  return ReadFeeds(TX(t).Work().exec_prepared("list_feeds"));
}

Result PgRepository::DeleteFeed(Transaction& t, int64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_feed", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "feed " + std::to_string(id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Feed entries
// ------------------------------------------------------------------

Result PgRepository::InsertFeedEntry(Transaction& t, model::FeedEntryRecord& r) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("insert_feed_entry", r.feed_id, r.title, r.published_at, r.url);
    if (!res.empty()) {
      r.id = res[0][0].as<int64_t>();
      return Result::Ok();
    }

    // ON CONFLICT DO NOTHING returns no row: report the survivor.
    auto existing = work.exec_prepared("get_feed_entry_by_key", r.feed_id, r.published_at, r.url);
    if (!existing.empty()) {
      r.id = existing[0][0].as<int64_t>();
    }
    return Result::Err(ErrorCode::AlreadyExists, "duplicate feed entry");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FeedEntryRecord> PgRepository::GetFeedEntry(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_feed_entry", id);
  if (res.empty()) return std::nullopt;
  return ReadFeedEntry(res[0]);
}

std::vector<model::FeedEntryRecord> PgRepository::ListFeedEntries(Transaction& t, int64_t feed_id,
                                                                  const std::optional<std::string>& published_after) {
  auto& work = TX(t).Work();
  if (published_after.has_value()) {
    return ReadFeedEntries(work.exec_prepared("list_feed_entries_since", feed_id, *published_after));
  }
  return ReadFeedEntries(work.exec_prepared("list_feed_entries", feed_id));
}

Result PgRepository::DeleteFeedEntry(Transaction& t, int64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_feed_entry", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "feed entry " + std::to_string(id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result PgRepository::InsertUser(Transaction& t, model::UserRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_user", r.username);
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UserRecord> PgRepository::GetUser(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_user", id);
  if (res.empty()) return std::nullopt;
  return ReadUser(res[0]);
}

std::optional<model::UserRecord> PgRepository::GetUserByName(Transaction& t, const std::string& username) {
  auto res = TX(t).Work().exec_prepared("get_user_by_name", username);
  if (res.empty()) return std::nullopt;
  return ReadUser(res[0]);
}

std::vector<model::UserRecord> PgRepository::ListUsers(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_users");

  std::vector<model::UserRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadUser(row));
  }
  return out;
}

Result PgRepository::DeleteUser(Transaction& t, int64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_user", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "user " + std::to_string(id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result PgRepository::InsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_subscription", r.user_id, r.feed_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "already subscribed");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_subscription", r.user_id, r.feed_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "not subscribed");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FeedRecord> PgRepository::ListSubscribedFeeds(Transaction& t, int64_t user_id) {
  return ReadFeeds(TX(t).Work().exec_prepared("list_subscribed_feeds", user_id));
}

// ------------------------------------------------------------------
// Views
// ------------------------------------------------------------------

Result PgRepository::InsertView(Transaction& t, const model::ViewRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_view", r.user_id, r.feed_entry_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "already viewed");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgRepository::HasView(Transaction& t, const model::ViewRecord& r) {
  return !TX(t).Work().exec_prepared("has_view", r.user_id, r.feed_entry_id).empty();
}

std::vector<model::FeedEntryRecord> PgRepository::ListUnviewedEntries(Transaction& t, int64_t user_id) {
  return ReadFeedEntries(TX(t).Work().exec_prepared("list_unviewed_entries", user_id));
}

}
