#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/cache/client.hpp"
#include "internal/cache/message_queue.hpp"
#include "internal/db/api/repository.hpp"

namespace relcache::cache {

struct SubscriptionOptions {
  std::chrono::milliseconds poll_interval{100};
  std::size_t               batch_size  = 10;
  std::size_t               buffer_size = 100;
};

/*
  Polling subscriber over the message log.

  Attach registers (channel, sub_<uuid>) with cursor -1, then a
  background thread reads messages with id > cursor in id order,
  hands each to the bounded queue and only then advances and
  persists the cursor (at-least-once).

  Poll and cursor failures are logged and retried next tick.
  Detach stops the thread, deletes the cursor row and closes the
  queue; anything already buffered can still be received.
*/
class PollingSubscription final : public Subscription {
 public:
  // Registers the cursor row; throws util::StoreError if that fails.
  PollingSubscription(std::shared_ptr<db::Repository> repository, std::string channel, SubscriptionOptions options);
  ~PollingSubscription() override;

  PollingSubscription(const PollingSubscription&)            = delete;
  PollingSubscription& operator=(const PollingSubscription&) = delete;

  std::optional<std::string> Receive(std::chrono::milliseconds timeout) override;
  void                       Detach() override;

  const std::string& Channel() const override {
    return channel_;
  }

  const std::string& SubscriberId() const {
    return subscriber_;
  }

 private:
  void Run();
  void PollOnce();
  void PersistCursor(std::int64_t last_message_id);
  void Unregister();

  std::shared_ptr<db::Repository> repository_;
  std::string                     channel_;
  std::string                     subscriber_;
  SubscriptionOptions             options_;
  MessageQueue                    queue_;

  std::int64_t last_message_id_ = -1; // poller thread only

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace relcache::cache
