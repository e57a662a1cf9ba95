#include "seed_fixture.hpp"

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace gemfeed::store {

void SeedFixture(db::Repository& repository, bool reset) {
  auto tx = repository.Begin();

  if (reset) {
    for (const auto& feed : repository.ListFeeds(*tx)) {
      ThrowIfDbError(repository.DeleteFeed(*tx, feed.id), "reset feeds");
    }
    for (const auto& user : repository.ListUsers(*tx)) {
      ThrowIfDbError(repository.DeleteUser(*tx, user.id), "reset users");
    }
  }

  for (const char* url : {kSeedBostonFeedUrl, kSeedSkyjakeFeedUrl}) {
    db::model::FeedRecord feed;
    feed.url = url;
    ThrowIfDbError(repository.InsertFeed(*tx, feed), "seed feed");
  }
  for (const char* username : {kSeedUserJsvana, kSeedUserIchbinjoe}) {
    db::model::UserRecord user;
    user.username = username;
    ThrowIfDbError(repository.InsertUser(*tx, user), "seed user");
  }

  const auto jsvana  = repository.GetUserByName(*tx, kSeedUserJsvana);
  const auto skyjake = repository.GetFeedByUrl(*tx, kSeedSkyjakeFeedUrl);
  if (!jsvana || !skyjake) {
    throw util::InvalidState("seed rows missing after insert");
  }
  ThrowIfDbError(repository.InsertSubscription(*tx, {jsvana->id, skyjake->id}), "seed subscription");

  tx->Commit();
  GEMFEED_LOG_INFO("Seed fixture loaded", {observability::BoolField("reset", reset)});
}

} // namespace gemfeed::store
