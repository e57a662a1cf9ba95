#include "internal/store/subscription_manager.hpp"

#include <cassert>
#include <iostream>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/feed_store.hpp"
#include "internal/store/user_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using gemfeed::db::memory::MemoryRepository;
using gemfeed::store::FeedStore;
using gemfeed::store::SubscriptionManager;
using gemfeed::store::UserStore;

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestSubscribedFeedsScenario() {
  MemoryRepository    repo;
  FeedStore           feeds(repo);
  UserStore           users(repo);
  SubscriptionManager subscriptions(repo);

  assert(feeds.CreateFeed("gemini://a/") == 1);
  assert(feeds.CreateFeed("gemini://b/") == 2);
  const auto user = users.CreateUser("jsvana");
  assert(user == 1);

  assert(subscriptions.Subscribe(1, 2));

  const auto subscribed = subscriptions.ListSubscribedFeeds(1);
  assert(subscribed.size() == 1);
  assert(subscribed[0].id == 2);
  assert(subscribed[0].url == "gemini://b/");
}

void TestSubscribeIsIdempotent() {
  MemoryRepository    repo;
  FeedStore           feeds(repo);
  UserStore           users(repo);
  SubscriptionManager subscriptions(repo);

  const auto feed = feeds.CreateFeed("gemini://a/");
  const auto user = users.CreateUser("jsvana");

  assert(subscriptions.Subscribe(user, feed));
  assert(!subscriptions.Subscribe(user, feed));
  assert(subscriptions.ListSubscribedFeeds(user).size() == 1);

  assert(subscriptions.Unsubscribe(user, feed));
  assert(!subscriptions.Unsubscribe(user, feed));
  assert(subscriptions.ListSubscribedFeeds(user).empty());
}

void TestListIsOrderedByFeedId() {
  MemoryRepository    repo;
  FeedStore           feeds(repo);
  UserStore           users(repo);
  SubscriptionManager subscriptions(repo);

  const auto a    = feeds.CreateFeed("gemini://a/");
  const auto b    = feeds.CreateFeed("gemini://b/");
  const auto c    = feeds.CreateFeed("gemini://c/");
  const auto user = users.CreateUser("jsvana");

  subscriptions.Subscribe(user, c);
  subscriptions.Subscribe(user, a);

  const auto subscribed = subscriptions.ListSubscribedFeeds(user);
  assert(subscribed.size() == 2);
  assert(subscribed[0].id == a);
  assert(subscribed[1].id == c);
  (void)b;
}

void TestMissingEndpointsAreNotFound() {
  MemoryRepository    repo;
  FeedStore           feeds(repo);
  UserStore           users(repo);
  SubscriptionManager subscriptions(repo);

  const auto feed = feeds.CreateFeed("gemini://a/");
  const auto user = users.CreateUser("jsvana");

  assert(Throws<gemfeed::util::NotFound>([&] { subscriptions.Subscribe(user + 10, feed); }));
  assert(Throws<gemfeed::util::NotFound>([&] { subscriptions.Subscribe(user, feed + 10); }));
  assert(Throws<gemfeed::util::NotFound>([&] { subscriptions.ListSubscribedFeeds(user + 10); }));
}

void TestSubscriptionsFollowTheirEndpoints() {
  MemoryRepository    repo;
  FeedStore           feeds(repo);
  UserStore           users(repo);
  SubscriptionManager subscriptions(repo);

  const auto a    = feeds.CreateFeed("gemini://a/");
  const auto b    = feeds.CreateFeed("gemini://b/");
  const auto user = users.CreateUser("jsvana");
  subscriptions.Subscribe(user, a);
  subscriptions.Subscribe(user, b);

  feeds.DeleteFeed(a);
  const auto remaining = subscriptions.ListSubscribedFeeds(user);
  assert(remaining.size() == 1);
  assert(remaining[0].id == b);

  users.DeleteUser(user);
  assert(Throws<gemfeed::util::NotFound>([&] { subscriptions.ListSubscribedFeeds(user); }));

  // a recreated user starts with no subscriptions
  const auto again = users.CreateUser("jsvana");
  assert(subscriptions.ListSubscribedFeeds(again).empty());
}

} // namespace

int main() {
  TestSubscribedFeedsScenario();
  TestSubscribeIsIdempotent();
  TestListIsOrderedByFeedId();
  TestMissingEndpointsAreNotFound();
  TestSubscriptionsFollowTheirEndpoints();

  std::cout << "gemfeed_unit_subscription_manager: pass\n";
  return 0;
}
