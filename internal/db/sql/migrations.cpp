#include "migrations.hpp"

#include <stdexcept>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace gemfeed::db::sql {

namespace {

std::vector<Migration> BuildSqliteMigrations() {
  return {
      {20210107030800,
       "feeds",
       {"CREATE TABLE IF NOT EXISTS feeds ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "url TEXT NOT NULL, "
        "name TEXT);"}},
      {20210107030830,
       "users",
       {"CREATE TABLE IF NOT EXISTS users ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "username TEXT NOT NULL);"}},
      {20210107030853,
       "feed_entries",
       {"CREATE TABLE IF NOT EXISTS feed_entries ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "feed_id INTEGER NOT NULL, "
        "title TEXT NOT NULL, "
        "published_at TEXT NOT NULL, "
        "url TEXT NOT NULL, "
        "FOREIGN KEY(feed_id) REFERENCES feeds(id) ON DELETE CASCADE, "
        "UNIQUE(feed_id, published_at, url));"}},
      {20210107030912,
       "views",
       {"CREATE TABLE IF NOT EXISTS views ("
        "user_id INT NOT NULL, "
        "feed_entry_id INT NOT NULL, "
        "FOREIGN KEY(user_id) REFERENCES users(id) ON DELETE CASCADE, "
        "FOREIGN KEY(feed_entry_id) REFERENCES feed_entries(id) ON DELETE CASCADE);"}},
      {20210110190931,
       "subscriptions",
       {"CREATE TABLE IF NOT EXISTS subscriptions ("
        "user_id INT NOT NULL, "
        "feed_id INT NOT NULL, "
        "FOREIGN KEY(user_id) REFERENCES users(id), "
        "FOREIGN KEY(feed_id) REFERENCES feeds(id));"}},
      // SQLite cannot alter a foreign key in place: rebuild the table.
      {20210111120000,
       "subscriptions_cascade",
       {"CREATE TABLE subscriptions_new ("
        "user_id INT NOT NULL, "
        "feed_id INT NOT NULL, "
        "FOREIGN KEY(user_id) REFERENCES users(id) ON DELETE CASCADE, "
        "FOREIGN KEY(feed_id) REFERENCES feeds(id) ON DELETE CASCADE, "
        "UNIQUE(user_id, feed_id));",
        "INSERT INTO subscriptions_new(user_id, feed_id) "
        "SELECT DISTINCT user_id, feed_id FROM subscriptions "
        "WHERE user_id IN (SELECT id FROM users) AND feed_id IN (SELECT id FROM feeds);",
        "DROP TABLE subscriptions;",
        "ALTER TABLE subscriptions_new RENAME TO subscriptions;"}},
      {20210111120100,
       "views_unique",
       {"DELETE FROM views WHERE rowid NOT IN ("
        "SELECT MIN(rowid) FROM views GROUP BY user_id, feed_entry_id);",
        "CREATE UNIQUE INDEX IF NOT EXISTS views_user_entry ON views(user_id, feed_entry_id);"}},
      // Rows sharing a url or username collapse into the lowest id. Entries,
      // subscriptions and views follow their row before the extras go.
      {20210111120200,
       "unique_feed_url_and_username",
       {"CREATE TEMP TABLE feed_canon AS "
        "SELECT id, (SELECT MIN(g.id) FROM feeds g WHERE g.url = feeds.url) AS canon FROM feeds;",
        "CREATE TEMP TABLE entry_canon AS "
        "SELECT e.id AS id, (SELECT MIN(e2.id) FROM feed_entries e2 JOIN feed_canon m2 ON m2.id = e2.feed_id "
        "WHERE m2.canon = m.canon AND e2.published_at = e.published_at AND e2.url = e.url) AS canon "
        "FROM feed_entries e JOIN feed_canon m ON m.id = e.feed_id;",
        "DELETE FROM entry_canon WHERE id = canon;",
        "INSERT OR IGNORE INTO views(user_id, feed_entry_id) "
        "SELECT v.user_id, c.canon FROM views v JOIN entry_canon c ON c.id = v.feed_entry_id;",
        "DELETE FROM feed_entries WHERE id IN (SELECT id FROM entry_canon);",
        "DELETE FROM feed_canon WHERE id = canon;",
        "UPDATE feed_entries SET feed_id = (SELECT c.canon FROM feed_canon c WHERE c.id = feed_entries.feed_id) "
        "WHERE feed_id IN (SELECT id FROM feed_canon);",
        "INSERT OR IGNORE INTO subscriptions(user_id, feed_id) "
        "SELECT s.user_id, c.canon FROM subscriptions s JOIN feed_canon c ON c.id = s.feed_id;",
        "DELETE FROM feeds WHERE id IN (SELECT id FROM feed_canon);",
        "CREATE TEMP TABLE user_canon AS "
        "SELECT id, (SELECT MIN(g.id) FROM users g WHERE g.username = users.username) AS canon FROM users;",
        "DELETE FROM user_canon WHERE id = canon;",
        "INSERT OR IGNORE INTO subscriptions(user_id, feed_id) "
        "SELECT c.canon, s.feed_id FROM subscriptions s JOIN user_canon c ON c.id = s.user_id;",
        "INSERT OR IGNORE INTO views(user_id, feed_entry_id) "
        "SELECT c.canon, v.feed_entry_id FROM views v JOIN user_canon c ON c.id = v.user_id;",
        "DELETE FROM users WHERE id IN (SELECT id FROM user_canon);",
        "DROP TABLE entry_canon;",
        "DROP TABLE feed_canon;",
        "DROP TABLE user_canon;",
        "CREATE UNIQUE INDEX IF NOT EXISTS feeds_url ON feeds(url);",
        "CREATE UNIQUE INDEX IF NOT EXISTS users_username ON users(username);"}},
  };
}

std::vector<Migration> BuildPostgresMigrations() {
  return {
      {20210107030800,
       "feeds",
       {"CREATE TABLE IF NOT EXISTS feeds ("
        "id BIGSERIAL PRIMARY KEY, "
        "url TEXT NOT NULL, "
        "name TEXT);"}},
      {20210107030830,
       "users",
       {"CREATE TABLE IF NOT EXISTS users ("
        "id BIGSERIAL PRIMARY KEY, "
        "username TEXT NOT NULL);"}},
      {20210107030853,
       "feed_entries",
       {"CREATE TABLE IF NOT EXISTS feed_entries ("
        "id BIGSERIAL PRIMARY KEY, "
        "feed_id BIGINT NOT NULL REFERENCES feeds(id) ON DELETE CASCADE, "
        "title TEXT NOT NULL, "
        "published_at TEXT NOT NULL, "
        "url TEXT NOT NULL, "
        "UNIQUE(feed_id, published_at, url));"}},
      {20210107030912,
       "views",
       {"CREATE TABLE IF NOT EXISTS views ("
        "user_id BIGINT NOT NULL REFERENCES users(id) ON DELETE CASCADE, "
        "feed_entry_id BIGINT NOT NULL REFERENCES feed_entries(id) ON DELETE CASCADE);"}},
      {20210110190931,
       "subscriptions",
       {"CREATE TABLE IF NOT EXISTS subscriptions ("
        "user_id BIGINT NOT NULL REFERENCES users(id), "
        "feed_id BIGINT NOT NULL REFERENCES feeds(id));"}},
      {20210111120000,
       "subscriptions_cascade",
       {"DELETE FROM subscriptions a USING subscriptions b "
        "WHERE a.ctid > b.ctid AND a.user_id = b.user_id AND a.feed_id = b.feed_id;",
        "ALTER TABLE subscriptions "
        "DROP CONSTRAINT IF EXISTS subscriptions_user_id_fkey, "
        "DROP CONSTRAINT IF EXISTS subscriptions_feed_id_fkey, "
        "ADD CONSTRAINT subscriptions_user_id_fkey FOREIGN KEY(user_id) REFERENCES users(id) ON DELETE CASCADE, "
        "ADD CONSTRAINT subscriptions_feed_id_fkey FOREIGN KEY(feed_id) REFERENCES feeds(id) ON DELETE CASCADE, "
        "ADD CONSTRAINT subscriptions_user_feed_key UNIQUE(user_id, feed_id);"}},
      {20210111120100,
       "views_unique",
       {"DELETE FROM views a USING views b "
        "WHERE a.ctid > b.ctid AND a.user_id = b.user_id AND a.feed_entry_id = b.feed_entry_id;",
        "CREATE UNIQUE INDEX IF NOT EXISTS views_user_entry ON views(user_id, feed_entry_id);"}},
      {20210111120200,
       "unique_feed_url_and_username",
       {"CREATE TEMP TABLE feed_canon AS "
        "SELECT id, MIN(id) OVER (PARTITION BY url) AS canon FROM feeds;",
        "CREATE TEMP TABLE entry_canon AS "
        "SELECT e.id, MIN(e.id) OVER (PARTITION BY m.canon, e.published_at, e.url) AS canon "
        "FROM feed_entries e JOIN feed_canon m ON m.id = e.feed_id;",
        "DELETE FROM entry_canon WHERE id = canon;",
        "INSERT INTO views(user_id, feed_entry_id) "
        "SELECT v.user_id, c.canon FROM views v JOIN entry_canon c ON c.id = v.feed_entry_id "
        "ON CONFLICT DO NOTHING;",
        "DELETE FROM feed_entries WHERE id IN (SELECT id FROM entry_canon);",
        "DELETE FROM feed_canon WHERE id = canon;",
        "UPDATE feed_entries e SET feed_id = c.canon FROM feed_canon c WHERE c.id = e.feed_id;",
        "INSERT INTO subscriptions(user_id, feed_id) "
        "SELECT s.user_id, c.canon FROM subscriptions s JOIN feed_canon c ON c.id = s.feed_id "
        "ON CONFLICT DO NOTHING;",
        "DELETE FROM feeds WHERE id IN (SELECT id FROM feed_canon);",
        "CREATE TEMP TABLE user_canon AS "
        "SELECT id, MIN(id) OVER (PARTITION BY username) AS canon FROM users;",
        "DELETE FROM user_canon WHERE id = canon;",
        "INSERT INTO subscriptions(user_id, feed_id) "
        "SELECT c.canon, s.feed_id FROM subscriptions s JOIN user_canon c ON c.id = s.user_id "
        "ON CONFLICT DO NOTHING;",
        "INSERT INTO views(user_id, feed_entry_id) "
        "SELECT c.canon, v.feed_entry_id FROM views v JOIN user_canon c ON c.id = v.user_id "
        "ON CONFLICT DO NOTHING;",
        "DELETE FROM users WHERE id IN (SELECT id FROM user_canon);",
        "DROP TABLE entry_canon, feed_canon, user_canon;",
        "CREATE UNIQUE INDEX IF NOT EXISTS feeds_url ON feeds(url);",
        "CREATE UNIQUE INDEX IF NOT EXISTS users_username ON users(username);"}},
  };
}

} // namespace

const std::vector<Migration>& Migrations(Dialect dialect) {
  static const std::vector<Migration> kSqlite   = BuildSqliteMigrations();
  static const std::vector<Migration> kPostgres = BuildPostgresMigrations();
  return dialect == Dialect::kPostgres ? kPostgres : kSqlite;
}

std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  for (std::size_t i = 1; i < ordered.size(); ++i) {
    if (ordered[i].version <= ordered[i - 1].version) {
      throw std::logic_error("migrations out of order at version " + std::to_string(ordered[i].version));
    }
  }

  executor.EnsureMigrationTable();

  std::unordered_set<int64_t> applied;
  for (const auto& record : executor.AppliedMigrations()) {
    applied.insert(record.version);
  }

  std::size_t count = 0;
  for (const auto& migration : ordered) {
    if (applied.contains(migration.version)) {
      continue;
    }

    try {
      executor.Apply(migration, util::ToUnixMillis(util::Now()));
    } catch (const std::exception& e) {
      GEMFEED_LOG_ERROR("Migration failed", {observability::IntField("version", migration.version),
                                             observability::StringField("name", migration.name),
                                             observability::StringField("error", e.what())});
      throw;
    }

    GEMFEED_LOG_INFO("Applied migration",
                     {observability::IntField("version", migration.version), observability::StringField("name", migration.name)});
    ++count;
  }

  return count;
}

} // namespace gemfeed::db::sql
