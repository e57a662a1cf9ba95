#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"

#if GEMFEED_DB_POSTGRES
#include "internal/db/postgres/pg_migrations.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using gemfeed::db::ErrorCode;
using gemfeed::db::Repository;
using gemfeed::db::memory::MemoryRepository;
using gemfeed::db::model::FeedEntryRecord;
using gemfeed::db::model::FeedRecord;
using gemfeed::db::model::UserRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// How a backend reacts to a second transaction opened while one is live.
enum class ParallelMode {
  kSnapshotConflict, // both open, second writer fails at commit
  kBeginThrows,      // one connection, second Begin() fails
  kIndependent,      // both open and commit
};

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  ParallelMode                                      parallel_mode = ParallelMode::kIndependent;
};

int64_t AddFeed(Repository& repo, gemfeed::db::Transaction& tx, const std::string& url) {
  FeedRecord feed;
  feed.url = url;
  assert(repo.InsertFeed(tx, feed));
  assert(feed.id > 0);
  return feed.id;
}

int64_t AddUser(Repository& repo, gemfeed::db::Transaction& tx, const std::string& username) {
  UserRecord user;
  user.username = username;
  assert(repo.InsertUser(tx, user));
  assert(user.id > 0);
  return user.id;
}

int64_t AddEntry(Repository& repo, gemfeed::db::Transaction& tx, int64_t feed_id, const std::string& published_at,
                 const std::string& url) {
  FeedEntryRecord entry{.feed_id = feed_id, .title = "entry " + url, .published_at = published_at, .url = url};
  assert(repo.InsertFeedEntry(tx, entry));
  assert(entry.id > 0);
  return entry.id;
}

void VerifyFeedLifecycle(Repository& repo, const std::string& prefix) {
  const auto url = "gemini://" + prefix + "/feed/";

  int64_t id = 0;
  {
    auto       tx = repo.Begin();
    FeedRecord feed{.url = url, .name = "Feed"};
    assert(repo.InsertFeed(*tx, feed));
    id = feed.id;

    auto read = repo.GetFeed(*tx, id);
    assert(read.has_value());
    assert(read->url == url);
    assert(read->name == "Feed");

    auto by_url = repo.GetFeedByUrl(*tx, url);
    assert(by_url.has_value());
    assert(by_url->id == id);
    tx->Commit();
  }

  // a failed statement may poison the transaction, so it gets its own
  {
    auto       tx = repo.Begin();
    FeedRecord duplicate{.url = url};
    auto       result = repo.InsertFeed(*tx, duplicate);
    assert(result.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteFeed(*tx, id));
    assert(!repo.GetFeed(*tx, id).has_value());
    assert(repo.DeleteFeed(*tx, id).code == ErrorCode::NotFound);
    tx->Commit();
  }
}

void VerifyEntryDedupAndOrdering(Repository& repo, const std::string& prefix) {
  auto       tx      = repo.Begin();
  const auto feed_id = AddFeed(repo, *tx, "gemini://" + prefix + "/entries/");

  const auto late  = AddEntry(repo, *tx, feed_id, "2021-01-03", "gemini://a/3");
  const auto early = AddEntry(repo, *tx, feed_id, "2021-01-01", "gemini://a/1");
  const auto mid   = AddEntry(repo, *tx, feed_id, "2021-01-02", "gemini://a/2");

  FeedEntryRecord again{.feed_id = feed_id, .title = "other title", .published_at = "2021-01-01", .url = "gemini://a/1"};
  const auto      dup = repo.InsertFeedEntry(*tx, again);
  assert(dup.code == ErrorCode::AlreadyExists);
  assert(again.id == early);

  // same url on a different date is a different entry
  const auto republished = AddEntry(repo, *tx, feed_id, "2021-01-04", "gemini://a/1");

  const auto all = repo.ListFeedEntries(*tx, feed_id, std::nullopt);
  assert(all.size() == 4);
  assert(all[0].id == early);
  assert(all[0].title == "entry gemini://a/1");
  assert(all[1].id == mid);
  assert(all[2].id == late);
  assert(all[3].id == republished);

  const auto since = repo.ListFeedEntries(*tx, feed_id, std::string("2021-01-02"));
  assert(since.size() == 2);
  assert(since[0].id == late);
  assert(since[1].id == republished);

  assert(repo.DeleteFeedEntry(*tx, mid));
  assert(!repo.GetFeedEntry(*tx, mid).has_value());
  assert(repo.DeleteFeedEntry(*tx, mid).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyForeignKeys(Repository& repo) {
  {
    auto            tx = repo.Begin();
    FeedEntryRecord orphan{.feed_id = 987654, .title = "t", .published_at = "2021-01-01", .url = "gemini://orphan/"};
    assert(repo.InsertFeedEntry(*tx, orphan).code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertSubscription(*tx, {987654, 987655}).code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertView(*tx, {987654, 987655}).code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }
}

void VerifySubscriptionsAndViews(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto user    = AddUser(repo, *tx, prefix + "-reader");
  const auto other   = AddUser(repo, *tx, prefix + "-other");
  const auto feed_a  = AddFeed(repo, *tx, "gemini://" + prefix + "/a/");
  const auto feed_b  = AddFeed(repo, *tx, "gemini://" + prefix + "/b/");
  const auto entry_a = AddEntry(repo, *tx, feed_a, "2021-01-01", "gemini://a/x");
  const auto entry_b1 = AddEntry(repo, *tx, feed_b, "2021-01-02", "gemini://b/1");
  const auto entry_b2 = AddEntry(repo, *tx, feed_b, "2021-01-01", "gemini://b/2");

  assert(repo.InsertSubscription(*tx, {user, feed_b}));
  assert(repo.InsertSubscription(*tx, {user, feed_b}).code == ErrorCode::AlreadyExists);
  assert(repo.InsertSubscription(*tx, {other, feed_a}));

  const auto subscribed = repo.ListSubscribedFeeds(*tx, user);
  assert(subscribed.size() == 1);
  assert(subscribed[0].id == feed_b);

  auto unviewed = repo.ListUnviewedEntries(*tx, user);
  assert(unviewed.size() == 2);
  assert(unviewed[0].id == entry_b2);
  assert(unviewed[1].id == entry_b1);

  assert(repo.InsertView(*tx, {user, entry_b2}));
  assert(repo.InsertView(*tx, {user, entry_b2}).code == ErrorCode::AlreadyExists);
  assert(repo.HasView(*tx, {user, entry_b2}));
  assert(!repo.HasView(*tx, {other, entry_b2}));

  // a view on an unsubscribed feed never surfaces
  assert(repo.InsertView(*tx, {user, entry_a}));

  unviewed = repo.ListUnviewedEntries(*tx, user);
  assert(unviewed.size() == 1);
  assert(unviewed[0].id == entry_b1);

  assert(repo.DeleteSubscription(*tx, {user, feed_b}));
  assert(repo.DeleteSubscription(*tx, {user, feed_b}).code == ErrorCode::NotFound);
  assert(repo.ListUnviewedEntries(*tx, user).empty());
  tx->Commit();
}

void VerifyCascades(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto user  = AddUser(repo, *tx, prefix + "-cascade");
  const auto feed  = AddFeed(repo, *tx, "gemini://" + prefix + "/cascade/");
  const auto keep  = AddFeed(repo, *tx, "gemini://" + prefix + "/keep/");
  const auto entry = AddEntry(repo, *tx, feed, "2021-01-01", "gemini://c/1");
  const auto kept  = AddEntry(repo, *tx, keep, "2021-01-01", "gemini://k/1");

  assert(repo.InsertSubscription(*tx, {user, feed}));
  assert(repo.InsertSubscription(*tx, {user, keep}));
  assert(repo.InsertView(*tx, {user, entry}));
  assert(repo.InsertView(*tx, {user, kept}));

  // feed delete: entries, their views, subscriptions
  assert(repo.DeleteFeed(*tx, feed));
  assert(!repo.GetFeedEntry(*tx, entry).has_value());
  assert(repo.ListFeedEntries(*tx, feed, std::nullopt).empty());
  assert(!repo.HasView(*tx, {user, entry}));
  const auto remaining = repo.ListSubscribedFeeds(*tx, user);
  assert(remaining.size() == 1);
  assert(remaining[0].id == keep);

  // entry delete: views
  assert(repo.DeleteFeedEntry(*tx, kept));
  assert(!repo.HasView(*tx, {user, kept}));

  // user delete: subscriptions and views
  const auto kept2 = AddEntry(repo, *tx, keep, "2021-01-02", "gemini://k/2");
  assert(repo.InsertView(*tx, {user, kept2}));
  assert(repo.DeleteUser(*tx, user));
  assert(!repo.GetUser(*tx, user).has_value());
  assert(repo.ListSubscribedFeeds(*tx, user).empty());
  assert(!repo.HasView(*tx, {user, kept2}));
  assert(repo.GetFeedEntry(*tx, kept2).has_value());
  tx->Commit();
}

void VerifyUsers(Repository& repo, const std::string& prefix) {
  const auto name = prefix + "-user";
  {
    auto       tx = repo.Begin();
    const auto id = AddUser(repo, *tx, name);
    auto       by_name = repo.GetUserByName(*tx, name);
    assert(by_name.has_value());
    assert(by_name->id == id);
    assert(repo.GetUser(*tx, id)->username == name);

    bool listed = false;
    for (const auto& user : repo.ListUsers(*tx)) {
      listed = listed || user.id == id;
    }
    assert(listed);
    tx->Commit();
  }
  {
    auto       tx = repo.Begin();
    UserRecord duplicate{.username = name};
    assert(repo.InsertUser(*tx, duplicate).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto url = "gemini://" + prefix + "/rollback/";
  {
    auto tx = repo.Begin();
    AddFeed(repo, *tx, url);
    tx->Rollback();
  }
  {
    // destroyed without Commit()
    auto tx = repo.Begin();
    AddUser(repo, *tx, prefix + "-rollback");
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetFeedByUrl(*check_tx, url).has_value());
  assert(!repo.GetUserByName(*check_tx, prefix + "-rollback").has_value());
  check_tx->Commit();
}

void VerifyParallelTransactions(Repository& repo, const std::string& prefix, ParallelMode mode) {
  auto tx1 = repo.Begin();

  if (mode == ParallelMode::kBeginThrows) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  AddFeed(repo, *tx1, "gemini://" + prefix + "/parallel-1/");
  AddFeed(repo, *tx2, "gemini://" + prefix + "/parallel-2/");
  tx1->Commit();

  if (mode == ParallelMode::kSnapshotConflict) {
    bool threw = false;
    try {
      tx2->Commit();
    } catch (const gemfeed::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
  } else {
    tx2->Commit();
  }

  auto verify_tx = repo.Begin();
  assert(repo.GetFeedByUrl(*verify_tx, "gemini://" + prefix + "/parallel-1/").has_value());
  assert(repo.GetFeedByUrl(*verify_tx, "gemini://" + prefix + "/parallel-2/").has_value() ==
         (mode == ParallelMode::kIndependent));
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto    repo = backend.make_repository();
  int64_t feed = 0;
  int64_t user = 0;
  int64_t entry = 0;
  {
    auto tx = repo->Begin();
    feed    = AddFeed(*repo, *tx, "gemini://" + prefix + "/durable/");
    user    = AddUser(*repo, *tx, prefix + "-durable");
    entry   = AddEntry(*repo, *tx, feed, "2021-01-07", "gemini://durable/1");
    assert(repo->InsertSubscription(*tx, {user, feed}));
    assert(repo->InsertView(*tx, {user, entry}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetFeed(*tx, feed).has_value());
  assert(repo->GetUserByName(*tx, prefix + "-durable")->id == user);
  assert(repo->GetFeedEntry(*tx, entry)->published_at == "2021-01-07");
  assert(repo->ListSubscribedFeeds(*tx, user).size() == 1);
  assert(repo->HasView(*tx, {user, entry}));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .parallel_mode    = ParallelMode::kSnapshotConflict,
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("gemfeed_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<gemfeed::db::sqlite::SqliteDB>(db_path);
    gemfeed::db::sqlite::MigrateToLatest(db);
    return std::make_shared<gemfeed::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .parallel_mode = ParallelMode::kBeginThrows,
  };
}

#if GEMFEED_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("GEMFEED_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("GEMFEED_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  gemfeed::db::postgres::MigrateToLatest(conninfo);
  {
    pqxx::connection conn(conninfo);
    pqxx::work       tx(conn);
    tx.exec("TRUNCATE feeds, users, feed_entries, subscriptions, views RESTART IDENTITY CASCADE");
    tx.commit();
  }

  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<gemfeed::db::postgres::PgPool>(conninfo);
    return std::make_shared<gemfeed::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
      .parallel_mode    = ParallelMode::kIndependent,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyFeedLifecycle(*repo, backend.name);
    VerifyEntryDedupAndOrdering(*repo, backend.name);
    VerifyForeignKeys(*repo);
    VerifyUsers(*repo, backend.name);
    VerifySubscriptionsAndViews(*repo, backend.name);
    VerifyCascades(*repo, backend.name);
    VerifyRollbackBehavior(*repo, backend.name);
    VerifyParallelTransactions(*repo, backend.name, backend.parallel_mode);
  }

  VerifyRestartDurability(backend, backend.name);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

#if GEMFEED_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "gemfeed_integration_repository_parity: pass\n";
  return 0;
}
