#include "subscription.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace relcache::cache {

PollingSubscription::PollingSubscription(std::shared_ptr<db::Repository> repository, std::string channel,
                                         SubscriptionOptions options)
    : repository_(std::move(repository)),
      channel_(std::move(channel)),
      subscriber_(util::NewSubscriberId()),
      options_(options),
      queue_(options.buffer_size) {
  if (options_.batch_size == 0) options_.batch_size = 1;

  db::model::SubscriptionRecord record;
  record.channel         = channel_;
  record.subscriber      = subscriber_;
  record.last_message_id = -1;
  record.updated_at_ms   = util::NowMs();

  try {
    auto tx = repository_->Begin();
    auto r  = repository_->UpsertSubscription(*tx, record);
    if (!r) throw util::StoreError(r.code, "subscribe: " + r.message);
    tx->Commit();
  } catch (const db::DbError& e) {
    throw util::StoreError(e.code(), std::string("subscribe: ") + e.what());
  }

  RELCACHE_LOG_DEBUG("subscription attached", {observability::StringField("channel", channel_),
                                                observability::StringField("subscriber", subscriber_)});

  thread_ = std::thread(&PollingSubscription::Run, this);
}

PollingSubscription::~PollingSubscription() {
  Detach();
}

std::optional<std::string> PollingSubscription::Receive(std::chrono::milliseconds timeout) {
  return queue_.Pop(timeout);
}

void PollingSubscription::Detach() {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return;
    stopping_ = true;
  }
  cv_.notify_all();

  // wakes a poller blocked on a full queue; buffered messages stay readable
  queue_.Close();

  if (thread_.joinable()) thread_.join();
}

void PollingSubscription::Run() {
  for (;;) {
    PollOnce();

    std::unique_lock lock(mutex_);
    if (cv_.wait_for(lock, options_.poll_interval, [this] { return stopping_; })) break;
  }

  Unregister();
}

void PollingSubscription::PollOnce() {
  std::vector<db::model::MessageRecord> batch;
  try {
    auto tx = repository_->Begin();
    batch   = repository_->ReadMessages(*tx, channel_, last_message_id_, options_.batch_size);
    tx->Commit();
  } catch (const std::exception& e) {
    RELCACHE_LOG_WARN("subscription poll failed", {observability::StringField("channel", channel_),
                                                   observability::StringField("error", e.what())});
    return;
  }

  for (auto& message : batch) {
    if (!queue_.Push(std::move(message.payload))) return; // detached

    last_message_id_ = message.id;
    PersistCursor(last_message_id_);
  }
}

void PollingSubscription::PersistCursor(std::int64_t last_message_id) {
  try {
    auto tx = repository_->Begin();
    auto r  = repository_->UpdateSubscriptionCursor(*tx, channel_, subscriber_, last_message_id, util::NowMs());
    if (!r) {
      RELCACHE_LOG_WARN("subscription cursor update failed", {observability::StringField("channel", channel_),
                                                              observability::StringField("error", r.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    RELCACHE_LOG_WARN("subscription cursor update failed", {observability::StringField("channel", channel_),
                                                            observability::StringField("error", e.what())});
  }
}

void PollingSubscription::Unregister() {
  try {
    auto tx = repository_->Begin();
    auto r  = repository_->DeleteSubscription(*tx, channel_, subscriber_);
    if (r) {
      tx->Commit();
    } else {
      RELCACHE_LOG_WARN("subscription detach failed", {observability::StringField("channel", channel_),
                                                       observability::StringField("error", r.message)});
    }
  } catch (const std::exception& e) {
    RELCACHE_LOG_WARN("subscription detach failed", {observability::StringField("channel", channel_),
                                                     observability::StringField("error", e.what())});
  }

  queue_.Close();

  RELCACHE_LOG_DEBUG("subscription detached", {observability::StringField("channel", channel_),
                                                observability::StringField("subscriber", subscriber_)});
}

} // namespace relcache::cache
