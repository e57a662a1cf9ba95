#include "memory_repository.hpp"

#include <algorithm>
#include <limits>

#include "memory_tx.hpp"

namespace gemfeed::db::memory {

namespace {

bool ChronologicalLess(const model::FeedEntryRecord& a, const model::FeedEntryRecord& b) {
  if (a.published_at != b.published_at) return a.published_at < b.published_at;
  return a.id < b.id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

void MemoryRepository::EraseEntry(State& s, int64_t entry_id) {
  s.entries.erase(entry_id);
  std::erase_if(s.views, [&](const Pair& v) { return v.second == entry_id; });
}

// ------------------------------------------------------------------
// Feeds
// ------------------------------------------------------------------

Result MemoryRepository::InsertFeed(Transaction& t, model::FeedRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, feed] : s.feeds) {
    if (feed.url == r.url) return Result::Err(ErrorCode::AlreadyExists, "feed url " + r.url);
  }

  r.id          = s.next_feed_id++;
  s.feeds[r.id] = r;
  return Result::Ok();
}

std::optional<model::FeedRecord> MemoryRepository::GetFeed(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.feeds.find(id);
  if (it == s.feeds.end()) return std::nullopt;
  return it->second;
}

std::optional<model::FeedRecord> MemoryRepository::GetFeedByUrl(Transaction& t, const std::string& url) {
  for (const auto& [_, feed] : TX(t).View().feeds) {
    if (feed.url == url) return feed;
  }
  return std::nullopt;
}

std::vector<model::FeedRecord> MemoryRepository::ListFeeds(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::FeedRecord> out;
  out.reserve(s.feeds.size());
  for (const auto& [_, feed] : s.feeds) {
    out.push_back(feed);
  }
  return out;
}

Result MemoryRepository::DeleteFeed(Transaction& t, int64_t id) {
  auto& s = TX(t).Mutable();
  if (!s.feeds.contains(id)) return Result::Err(ErrorCode::NotFound, "feed " + std::to_string(id));

  std::vector<int64_t> owned;
  for (const auto& [entry_id, entry] : s.entries) {
    if (entry.feed_id == id) owned.push_back(entry_id);
  }
  for (const auto entry_id : owned) {
    EraseEntry(s, entry_id);
  }

  std::erase_if(s.subscriptions, [&](const Pair& sub) { return sub.second == id; });
  s.feeds.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Feed entries
// ------------------------------------------------------------------

Result MemoryRepository::InsertFeedEntry(Transaction& t, model::FeedEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.feeds.contains(r.feed_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: feed " + std::to_string(r.feed_id));
  }

  for (const auto& [entry_id, entry] : s.entries) {
    if (entry.feed_id == r.feed_id && entry.published_at == r.published_at && entry.url == r.url) {
      r.id = entry_id;
      return Result::Err(ErrorCode::AlreadyExists, "duplicate feed entry");
    }
  }

  r.id            = s.next_entry_id++;
  s.entries[r.id] = r;
  return Result::Ok();
}

std::optional<model::FeedEntryRecord> MemoryRepository::GetFeedEntry(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.entries.find(id);
  if (it == s.entries.end()) return std::nullopt;
  return it->second;
}

std::vector<model::FeedEntryRecord> MemoryRepository::ListFeedEntries(Transaction& t, int64_t feed_id,
                                                                      const std::optional<std::string>& published_after) {
  std::vector<model::FeedEntryRecord> out;
  for (const auto& [_, entry] : TX(t).View().entries) {
    if (entry.feed_id != feed_id) continue;
    if (published_after.has_value() && !(entry.published_at > *published_after)) continue;
    out.push_back(entry);
  }
  std::sort(out.begin(), out.end(), ChronologicalLess);
  return out;
}

Result MemoryRepository::DeleteFeedEntry(Transaction& t, int64_t id) {
  auto& s = TX(t).Mutable();
  if (!s.entries.contains(id)) return Result::Err(ErrorCode::NotFound, "feed entry " + std::to_string(id));
  EraseEntry(s, id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result MemoryRepository::InsertUser(Transaction& t, model::UserRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, user] : s.users) {
    if (user.username == r.username) return Result::Err(ErrorCode::AlreadyExists, "username " + r.username);
  }

  r.id          = s.next_user_id++;
  s.users[r.id] = r;
  return Result::Ok();
}

std::optional<model::UserRecord> MemoryRepository::GetUser(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.users.find(id);
  if (it == s.users.end()) return std::nullopt;
  return it->second;
}

std::optional<model::UserRecord> MemoryRepository::GetUserByName(Transaction& t, const std::string& username) {
  for (const auto& [_, user] : TX(t).View().users) {
    if (user.username == username) return user;
  }
  return std::nullopt;
}

std::vector<model::UserRecord> MemoryRepository::ListUsers(Transaction& t) {
  std::vector<model::UserRecord> out;
  for (const auto& [_, user] : TX(t).View().users) {
    out.push_back(user);
  }
  return out;
}

Result MemoryRepository::DeleteUser(Transaction& t, int64_t id) {
  auto& s = TX(t).Mutable();
  if (!s.users.contains(id)) return Result::Err(ErrorCode::NotFound, "user " + std::to_string(id));

  std::erase_if(s.subscriptions, [&](const Pair& sub) { return sub.first == id; });
  std::erase_if(s.views, [&](const Pair& v) { return v.first == id; });
  s.users.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.users.contains(r.user_id) || !s.feeds.contains(r.feed_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed");
  }
  if (!s.subscriptions.emplace(r.user_id, r.feed_id).second) {
    return Result::Err(ErrorCode::AlreadyExists, "already subscribed");
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.subscriptions.erase({r.user_id, r.feed_id}) == 0) {
    return Result::Err(ErrorCode::NotFound, "not subscribed");
  }
  return Result::Ok();
}

std::vector<model::FeedRecord> MemoryRepository::ListSubscribedFeeds(Transaction& t, int64_t user_id) {
  const auto&                    s = TX(t).View();
  std::vector<model::FeedRecord> out;
  // set order is (user_id, feed_id), so feeds come out ordered by id
  for (auto it = s.subscriptions.lower_bound({user_id, std::numeric_limits<int64_t>::min()}); it != s.subscriptions.end() && it->first == user_id; ++it) {
    const auto feed = s.feeds.find(it->second);
    if (feed != s.feeds.end()) out.push_back(feed->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Views
// ------------------------------------------------------------------

Result MemoryRepository::InsertView(Transaction& t, const model::ViewRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.users.contains(r.user_id) || !s.entries.contains(r.feed_entry_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed");
  }
  if (!s.views.emplace(r.user_id, r.feed_entry_id).second) {
    return Result::Err(ErrorCode::AlreadyExists, "already viewed");
  }
  return Result::Ok();
}

bool MemoryRepository::HasView(Transaction& t, const model::ViewRecord& r) {
  return TX(t).View().views.contains({r.user_id, r.feed_entry_id});
}

std::vector<model::FeedEntryRecord> MemoryRepository::ListUnviewedEntries(Transaction& t, int64_t user_id) {
  const auto&                         s = TX(t).View();
  std::vector<model::FeedEntryRecord> out;
  for (const auto& [entry_id, entry] : s.entries) {
    if (!s.subscriptions.contains({user_id, entry.feed_id})) continue;
    if (s.views.contains({user_id, entry_id})) continue;
    out.push_back(entry);
  }
  std::sort(out.begin(), out.end(), ChronologicalLess);
  return out;
}

} // namespace gemfeed::db::memory
