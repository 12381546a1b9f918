#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cache/cmdable_adapter.hpp"
#include "internal/cache/reaper.hpp"
#include "internal/cache/store_client.hpp"
#include "internal/db/api/repository.hpp"

namespace relcache::factory {

/*
  Application

  Owns all long-lived objects of a relcache process.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<cache::StoreClient>    client;
  std::shared_ptr<cache::ExpiryReaper>   reaper;
  std::shared_ptr<cache::CmdableAdapter> commands;
};

/*
  Build

  Constructs the backend from runtime config, creates the schema,
  registers the client (cache::SetClient) and, when start_reaper is
  set, starts the expiry reaper.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const relcache::runtime::config::RuntimeConfig& config, bool start_reaper = true);

// Repository only, schema included. Exposed for tests.
std::shared_ptr<db::Repository> BuildRepository(const relcache::runtime::config::RuntimeConfig& config);

cache::ReaperOptions       ReaperOptionsFrom(const relcache::runtime::config::CacheConfig& cache);
cache::SubscriptionOptions SubscriptionOptionsFrom(const relcache::runtime::config::CacheConfig& cache);

} // namespace relcache::factory
