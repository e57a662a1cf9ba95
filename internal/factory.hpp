#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/store/feed_entry_store.hpp"
#include "internal/store/feed_store.hpp"
#include "internal/store/subscription_manager.hpp"
#include "internal/store/user_store.hpp"
#include "internal/store/view_tracker.hpp"

namespace gemfeed::factory {

/*
  Application

  Owns the repository and the stores bound to it. The stores hold a
  reference to *repository, so an Application is neither copied nor
  moved once built.
*/
struct Application {
  explicit Application(std::shared_ptr<db::Repository> repo);

  Application(const Application&)            = delete;
  Application& operator=(const Application&) = delete;

  std::shared_ptr<db::Repository> repository;

  store::FeedStore           feeds;
  store::FeedEntryStore      entries;
  store::UserStore           users;
  store::SubscriptionManager subscriptions;
  store::ViewTracker         views;
};

/*
  BuildRepository

  Opens the configured backend and migrates it to the latest schema.
  Throws util::InvalidArgument when no backend is configured.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const gemfeed::runtime::config::RuntimeConfig& config);

std::unique_ptr<Application> Build(const gemfeed::runtime::config::RuntimeConfig& config);

} // namespace gemfeed::factory
