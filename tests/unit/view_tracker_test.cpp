#include "internal/store/view_tracker.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/store/feed_entry_store.hpp"
#include "internal/store/feed_store.hpp"
#include "internal/store/subscription_manager.hpp"
#include "internal/store/user_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using gemfeed::db::Repository;
using gemfeed::db::memory::MemoryRepository;
using gemfeed::store::FeedEntryStore;
using gemfeed::store::FeedStore;
using gemfeed::store::SubscriptionManager;
using gemfeed::store::UserStore;
using gemfeed::store::ViewTracker;

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

// markViewed(1, 5); isViewed(1, 5); delete entry 5; isViewed(1, 5) is NotFound
void VerifyViewOfDeletedEntry(Repository& repo) {
  FeedStore      feeds(repo);
  FeedEntryStore entries(repo);
  UserStore      users(repo);
  ViewTracker    views(repo);

  const auto feed = feeds.CreateFeed("gemini://a/");
  const auto user = users.CreateUser("jsvana");
  assert(user == 1);
  for (int i = 1; i <= 5; ++i) {
    entries.RecordEntry(feed, "T" + std::to_string(i), "2021-01-0" + std::to_string(i), "gemini://a/" + std::to_string(i));
  }

  assert(views.MarkViewed(1, 5));
  assert(views.IsViewed(1, 5));
  assert(!views.IsViewed(1, 4));

  entries.DeleteEntry(5);
  assert(Throws<gemfeed::util::NotFound>([&] { views.IsViewed(1, 5); }));
  assert(Throws<gemfeed::util::NotFound>([&] { views.MarkViewed(1, 5); }));
}

void VerifyUnviewedEntries(Repository& repo) {
  FeedStore           feeds(repo);
  FeedEntryStore      entries(repo);
  UserStore           users(repo);
  SubscriptionManager subscriptions(repo);
  ViewTracker         views(repo);

  const auto followed   = feeds.CreateFeed("gemini://followed/");
  const auto unfollowed = feeds.CreateFeed("gemini://unfollowed/");
  const auto reader     = users.CreateUser("reader");
  const auto other      = users.CreateUser("other");
  subscriptions.Subscribe(reader, followed);
  subscriptions.Subscribe(other, followed);

  const auto newer = entries.RecordEntry(followed, "newer", "2021-01-02", "gemini://followed/2").entry_id;
  const auto older = entries.RecordEntry(followed, "older", "2021-01-01", "gemini://followed/1").entry_id;
  const auto elsewhere = entries.RecordEntry(unfollowed, "elsewhere", "2021-01-01", "gemini://unfollowed/1").entry_id;

  auto unviewed = views.ListUnviewedEntries(reader);
  assert(unviewed.size() == 2);
  assert(unviewed[0].id == older);
  assert(unviewed[1].id == newer);

  assert(views.MarkViewed(reader, older));
  assert(!views.MarkViewed(reader, older));
  assert(views.MarkViewed(reader, elsewhere));

  unviewed = views.ListUnviewedEntries(reader);
  assert(unviewed.size() == 1);
  assert(unviewed[0].id == newer);

  // read state is per user
  assert(views.ListUnviewedEntries(other).size() == 2);
  assert(!views.IsViewed(other, older));

  assert(Throws<gemfeed::util::NotFound>([&] { views.ListUnviewedEntries(reader + 100); }));
  assert(Throws<gemfeed::util::NotFound>([&] { views.MarkViewed(reader + 100, older); }));

  // deleting the user drops its views; the entries stay
  users.DeleteUser(reader);
  assert(views.ListUnviewedEntries(other).size() == 2);
  assert(entries.ListEntries(followed).size() == 2);
}

std::shared_ptr<gemfeed::db::sqlite::SqliteRepository> OpenSqlite(const std::string& path) {
  auto db = std::make_shared<gemfeed::db::sqlite::SqliteDB>(path);
  gemfeed::db::sqlite::MigrateToLatest(db);
  return std::make_shared<gemfeed::db::sqlite::SqliteRepository>(std::move(db));
}

std::string TempDbPath(const std::string& name) {
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return (std::filesystem::temp_directory_path() / ("gemfeed_views_" + name + "_" + std::to_string(now) + ".db")).string();
}

void RemoveDb(const std::string& path) {
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

} // namespace

int main() {
  {
    MemoryRepository repo;
    VerifyViewOfDeletedEntry(repo);
  }
  {
    MemoryRepository repo;
    VerifyUnviewedEntries(repo);
  }
  {
    const auto path = TempDbPath("deleted_entry");
    VerifyViewOfDeletedEntry(*OpenSqlite(path));
    RemoveDb(path);
  }
  {
    const auto path = TempDbPath("unviewed");
    VerifyUnviewedEntries(*OpenSqlite(path));
    RemoveDb(path);
  }

  std::cout << "gemfeed_unit_view_tracker: pass\n";
  return 0;
}
