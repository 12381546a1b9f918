#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace relcache::cache {

/*
  Bounded blocking queue between a subscription poller and its reader.

  Push blocks while full. After Close() pushes fail and Pop drains
  whatever is buffered before returning nullopt.
*/
class MessageQueue {
 public:
  explicit MessageQueue(std::size_t capacity);

  // false once closed
  bool Push(std::string message);

  std::optional<std::string> Pop(std::chrono::milliseconds timeout);

  void Close();

  std::size_t Size() const;

 private:
  std::size_t                capacity_;
  mutable std::mutex         mutex_;
  std::condition_variable    not_empty_;
  std::condition_variable    not_full_;
  std::deque<std::string>    queue_;
  bool                       closed_ = false;
};

} // namespace relcache::cache
