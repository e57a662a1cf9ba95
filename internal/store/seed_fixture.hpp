#pragma once

#include "internal/db/api/repository.hpp"

namespace gemfeed::store {

inline constexpr const char* kSeedBostonFeedUrl  = "gemini://gemini.conman.org/boston.gemini";
inline constexpr const char* kSeedSkyjakeFeedUrl = "gemini://skyjake.fi:1965/gemlog/";
inline constexpr const char* kSeedUserJsvana     = "jsvana";
inline constexpr const char* kSeedUserIchbinjoe  = "ichbinjoe";

/*
  Development fixture: two feeds, two users, jsvana subscribed to the
  skyjake gemlog. With reset every existing feed and user (and with them
  all entries, subscriptions and views) is removed first. Runs in one
  transaction.
*/

void SeedFixture(db::Repository& repository, bool reset);

} // namespace gemfeed::store
