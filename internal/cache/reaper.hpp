#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/db/api/repository.hpp"

namespace relcache::cache {

struct ReaperOptions {
  std::chrono::milliseconds initial_delay{std::chrono::minutes(5)};
  std::chrono::milliseconds interval{std::chrono::minutes(1)};
  std::chrono::milliseconds message_retention{0}; // 0 keeps messages forever
};

struct ReapStats {
  std::uint64_t expired_entries  = 0;
  std::uint64_t expired_messages = 0;
};

/*
  Background sweeper for expired entries.

  Expired rows are already invisible to readers; this only reclaims
  space. Waits initial_delay, then runs a pass every interval until
  Stop(). Failed passes are logged and retried on the next tick.
*/
class ExpiryReaper {
 public:
  ExpiryReaper(std::shared_ptr<db::Repository> repository, ReaperOptions options = {});
  ~ExpiryReaper();

  ExpiryReaper(const ExpiryReaper&)            = delete;
  ExpiryReaper& operator=(const ExpiryReaper&) = delete;

  void Start();

  // Wakes the loop and joins it. Safe to call more than once.
  void Stop();

  bool Running() const;

  // One synchronous pass. Throws util::StoreError.
  ReapStats RunOnce();

 private:
  void Run();

  std::shared_ptr<db::Repository> repository_;
  ReaperOptions                   options_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  bool                    stop_    = false;
  std::thread             thread_;
};

} // namespace relcache::cache
