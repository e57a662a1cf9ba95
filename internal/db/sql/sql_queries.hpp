#pragma once

namespace gemfeed::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  All statements bind their inputs positionally (?) and are
  prepared once per call; nothing is concatenated from caller data.
  The Postgres backend prepares the same statements with $N markers
  in PgPool::PrepareStatements.
*/

// feeds

static constexpr const char* INSERT_FEED =
    "INSERT INTO feeds(url,name) VALUES(?,?);";

static constexpr const char* SELECT_FEED =
    "SELECT id,url,COALESCE(name,'') FROM feeds WHERE id=?;";

static constexpr const char* SELECT_FEED_BY_URL =
    "SELECT id,url,COALESCE(name,'') FROM feeds WHERE url=?;";

static constexpr const char* SELECT_FEEDS =
    "SELECT id,url,COALESCE(name,'') FROM feeds ORDER BY id ASC;";

static constexpr const char* DELETE_FEED =
    "DELETE FROM feeds WHERE id=?;";

// feed entries

static constexpr const char* INSERT_FEED_ENTRY =
    "INSERT INTO feed_entries(feed_id,title,published_at,url) VALUES(?,?,?,?)"
    " ON CONFLICT(feed_id,published_at,url) DO NOTHING;";

static constexpr const char* SELECT_FEED_ENTRY_BY_KEY =
    "SELECT id FROM feed_entries WHERE feed_id=? AND published_at=? AND url=?;";

static constexpr const char* SELECT_FEED_ENTRY =
    "SELECT id,feed_id,title,published_at,url FROM feed_entries WHERE id=?;";

static constexpr const char* SELECT_FEED_ENTRIES =
    "SELECT id,feed_id,title,published_at,url FROM feed_entries"
    " WHERE feed_id=? ORDER BY published_at ASC, id ASC;";

static constexpr const char* SELECT_FEED_ENTRIES_SINCE =
    "SELECT id,feed_id,title,published_at,url FROM feed_entries"
    " WHERE feed_id=? AND published_at>? ORDER BY published_at ASC, id ASC;";

static constexpr const char* DELETE_FEED_ENTRY =
    "DELETE FROM feed_entries WHERE id=?;";

// users

static constexpr const char* INSERT_USER =
    "INSERT INTO users(username) VALUES(?);";

static constexpr const char* SELECT_USER =
    "SELECT id,username FROM users WHERE id=?;";

static constexpr const char* SELECT_USER_BY_NAME =
    "SELECT id,username FROM users WHERE username=?;";

static constexpr const char* SELECT_USERS =
    "SELECT id,username FROM users ORDER BY id ASC;";

static constexpr const char* DELETE_USER =
    "DELETE FROM users WHERE id=?;";

// subscriptions

static constexpr const char* INSERT_SUBSCRIPTION =
    "INSERT INTO subscriptions(user_id,feed_id) VALUES(?,?)"
    " ON CONFLICT(user_id,feed_id) DO NOTHING;";

static constexpr const char* DELETE_SUBSCRIPTION =
    "DELETE FROM subscriptions WHERE user_id=? AND feed_id=?;";

static constexpr const char* SELECT_SUBSCRIBED_FEEDS =
    "SELECT feeds.id,feeds.url,COALESCE(feeds.name,'') FROM subscriptions"
    " JOIN feeds ON feeds.id=subscriptions.feed_id"
    " WHERE subscriptions.user_id=? ORDER BY feeds.id ASC;";

// views

static constexpr const char* INSERT_VIEW =
    "INSERT INTO views(user_id,feed_entry_id) VALUES(?,?)"
    " ON CONFLICT(user_id,feed_entry_id) DO NOTHING;";

static constexpr const char* SELECT_VIEW =
    "SELECT 1 FROM views WHERE user_id=? AND feed_entry_id=?;";

// Read model: subscribed feeds minus what the user already read.
// Binds user_id twice.
static constexpr const char* SELECT_UNVIEWED_ENTRIES =
    "SELECT e.id,e.feed_id,e.title,e.published_at,e.url FROM feed_entries e"
    " JOIN subscriptions s ON s.feed_id=e.feed_id AND s.user_id=?"
    " WHERE NOT EXISTS("
    "SELECT 1 FROM views v WHERE v.user_id=? AND v.feed_entry_id=e.id)"
    " ORDER BY e.published_at ASC, e.id ASC;";

// migrations

static constexpr const char* CREATE_SCHEMA_MIGRATIONS =
    "CREATE TABLE IF NOT EXISTS schema_migrations ("
    "version INTEGER PRIMARY KEY, name TEXT NOT NULL, applied_at_ms INTEGER NOT NULL);";

static constexpr const char* SELECT_SCHEMA_MIGRATIONS =
    "SELECT version,name,applied_at_ms FROM schema_migrations ORDER BY version ASC;";

static constexpr const char* INSERT_SCHEMA_MIGRATION =
    "INSERT INTO schema_migrations(version,name,applied_at_ms) VALUES(?,?,?);";

} // namespace gemfeed::db::sql
