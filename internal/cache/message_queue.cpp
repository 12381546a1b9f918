#include "message_queue.hpp"

namespace relcache::cache {

MessageQueue::MessageQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool MessageQueue::Push(std::string message) {
  {
    std::unique_lock lock(mutex_);

    not_full_.wait(lock, [&] { return closed_ || queue_.size() < capacity_; });

    if (closed_) return false;

    queue_.push_back(std::move(message));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<std::string> MessageQueue::Pop(std::chrono::milliseconds timeout) {
  std::string message;
  {
    std::unique_lock lock(mutex_);

    not_empty_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    message = std::move(queue_.front());
    queue_.pop_front();
  }
  not_full_.notify_one();
  return message;
}

void MessageQueue::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::size_t MessageQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace relcache::cache
