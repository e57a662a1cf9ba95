#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/feed_record.hpp"

namespace gemfeed::store {

/*
  FeedStore

  Registered Gemini feeds. A feed url is registered at most once.
  Deleting a feed removes its entries, their views and every
  subscription to it.
*/

class FeedStore {
 public:
  explicit FeedStore(db::Repository& repository);

  int64_t                            CreateFeed(const std::string& url, const std::string& name = "");
  db::model::FeedRecord              GetFeed(int64_t id);
  std::vector<db::model::FeedRecord> ListFeeds();
  void                               DeleteFeed(int64_t id);

 private:
  db::Repository& repository_;
};

} // namespace gemfeed::store
