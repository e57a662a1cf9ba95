#include "pg_pool.hpp"

namespace gemfeed::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    lock.unlock();

    // a connection that died while idle is replaced, not handed out
    if (conn->is_open()) {
      return Wrap(conn.release());
    }
    conn.reset();
    lock.lock();
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // feeds
  conn.prepare("insert_feed", "INSERT INTO feeds(url,name) VALUES($1,$2) RETURNING id");
  conn.prepare("get_feed", "SELECT id,url,COALESCE(name,'') FROM feeds WHERE id=$1");
  conn.prepare("get_feed_by_url", "SELECT id,url,COALESCE(name,'') FROM feeds WHERE url=$1");
  conn.prepare("list_feeds", "SELECT id,url,COALESCE(name,'') FROM feeds ORDER BY id ASC");
  conn.prepare("delete_feed", "DELETE FROM feeds WHERE id=$1");

  // feed entries
  conn.prepare("insert_feed_entry",
               "INSERT INTO feed_entries(feed_id,title,published_at,url) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(feed_id,published_at,url) DO NOTHING RETURNING id");
  conn.prepare("get_feed_entry_by_key", "SELECT id FROM feed_entries WHERE feed_id=$1 AND published_at=$2 AND url=$3");
  conn.prepare("get_feed_entry", "SELECT id,feed_id,title,published_at,url FROM feed_entries WHERE id=$1");
  conn.prepare("list_feed_entries",
               "SELECT id,feed_id,title,published_at,url FROM feed_entries "
               "WHERE feed_id=$1 ORDER BY published_at ASC, id ASC");
  conn.prepare("list_feed_entries_since",
               "SELECT id,feed_id,title,published_at,url FROM feed_entries "
               "WHERE feed_id=$1 AND published_at>$2 ORDER BY published_at ASC, id ASC");
  conn.prepare("delete_feed_entry", "DELETE FROM feed_entries WHERE id=$1");

  // users
  conn.prepare("insert_user", "INSERT INTO users(username) VALUES($1) RETURNING id");
  conn.prepare("get_user", "SELECT id,username FROM users WHERE id=$1");
  conn.prepare("get_user_by_name", "SELECT id,username FROM users WHERE username=$1");
  conn.prepare("list_users", "SELECT id,username FROM users ORDER BY id ASC");
  conn.prepare("delete_user", "DELETE FROM users WHERE id=$1");

  // subscriptions
  conn.prepare("insert_subscription",
               "INSERT INTO subscriptions(user_id,feed_id) VALUES($1,$2) ON CONFLICT(user_id,feed_id) DO NOTHING");
  conn.prepare("delete_subscription", "DELETE FROM subscriptions WHERE user_id=$1 AND feed_id=$2");
  conn.prepare("list_subscribed_feeds",
               "SELECT feeds.id,feeds.url,COALESCE(feeds.name,'') FROM subscriptions "
               "JOIN feeds ON feeds.id=subscriptions.feed_id "
               "WHERE subscriptions.user_id=$1 ORDER BY feeds.id ASC");

  // views
  conn.prepare("insert_view",
               "INSERT INTO views(user_id,feed_entry_id) VALUES($1,$2) ON CONFLICT(user_id,feed_entry_id) DO NOTHING");
  conn.prepare("has_view", "SELECT 1 FROM views WHERE user_id=$1 AND feed_entry_id=$2");
  conn.prepare("list_unviewed_entries",
               "SELECT e.id,e.feed_id,e.title,e.published_at,e.url FROM feed_entries e "
               "JOIN subscriptions s ON s.feed_id=e.feed_id AND s.user_id=$1 "
               "WHERE NOT EXISTS(SELECT 1 FROM views v WHERE v.user_id=$1 AND v.feed_entry_id=e.id) "
               "ORDER BY e.published_at ASC, e.id ASC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace gemfeed::db::postgres
