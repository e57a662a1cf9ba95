#include "subscription_manager.hpp"

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace gemfeed::store {

SubscriptionManager::SubscriptionManager(db::Repository& repository) : repository_(repository) {
}

bool SubscriptionManager::Subscribe(int64_t user_id, int64_t feed_id) {
  auto tx = repository_.Begin();
  if (!repository_.GetUser(*tx, user_id)) {
    throw util::NotFound("user " + std::to_string(user_id));
  }
  if (!repository_.GetFeed(*tx, feed_id)) {
    throw util::NotFound("feed " + std::to_string(feed_id));
  }

  const auto result = repository_.InsertSubscription(*tx, {user_id, feed_id});
  if (result.code == db::ErrorCode::AlreadyExists) {
    tx->Commit();
    return false;
  }
  ThrowIfDbError(result, "subscribe");
  tx->Commit();

  GEMFEED_LOG_INFO("Subscribed", {observability::IntField("user_id", user_id),
                                  observability::IntField("feed_id", feed_id)});
  return true;
}

bool SubscriptionManager::Unsubscribe(int64_t user_id, int64_t feed_id) {
  auto       tx     = repository_.Begin();
  const auto result = repository_.DeleteSubscription(*tx, {user_id, feed_id});
  if (result.code == db::ErrorCode::NotFound) {
    tx->Commit();
    return false;
  }
  ThrowIfDbError(result, "unsubscribe");
  tx->Commit();

  GEMFEED_LOG_INFO("Unsubscribed", {observability::IntField("user_id", user_id),
                                    observability::IntField("feed_id", feed_id)});
  return true;
}

std::vector<db::model::FeedRecord> SubscriptionManager::ListSubscribedFeeds(int64_t user_id) {
  auto tx = repository_.Begin();
  if (!repository_.GetUser(*tx, user_id)) {
    throw util::NotFound("user " + std::to_string(user_id));
  }
  auto feeds = repository_.ListSubscribedFeeds(*tx, user_id);
  tx->Commit();
  return feeds;
}

} // namespace gemfeed::store
