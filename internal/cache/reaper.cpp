#include "reaper.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relcache::cache {

ExpiryReaper::ExpiryReaper(std::shared_ptr<db::Repository> repository, ReaperOptions options)
    : repository_(std::move(repository)), options_(options) {
}

ExpiryReaper::~ExpiryReaper() {
  Stop();
}

void ExpiryReaper::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;

  running_ = true;
  stop_    = false;
  thread_  = std::thread(&ExpiryReaper::Run, this);

  RELCACHE_LOG_INFO("expiry reaper started",
                    {observability::IntField("initial_delay_ms", options_.initial_delay.count()),
                     observability::IntField("interval_ms", options_.interval.count()),
                     observability::IntField("message_retention_ms", options_.message_retention.count())});
}

void ExpiryReaper::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    stop_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();

  std::lock_guard lock(mutex_);
  running_ = false;
}

bool ExpiryReaper::Running() const {
  std::lock_guard lock(mutex_);
  return running_ && !stop_;
}

ReapStats ExpiryReaper::RunOnce() {
  ReapStats    stats;
  std::int64_t now_ms = util::NowMs();

  try {
    auto tx = repository_->Begin();

    auto r = repository_->DeleteExpiredEntries(*tx, now_ms);
    if (!r) throw util::StoreError(r.code, "reap entries: " + r.message);
    stats.expired_entries = r.rows_affected;

    if (options_.message_retention.count() > 0) {
      auto m = repository_->DeleteMessagesOlderThan(*tx, now_ms - options_.message_retention.count());
      if (!m) throw util::StoreError(m.code, "reap messages: " + m.message);
      stats.expired_messages = m.rows_affected;
    }

    tx->Commit();
  } catch (const db::DbError& e) {
    throw util::StoreError(e.code(), std::string("reap: ") + e.what());
  }

  return stats;
}

void ExpiryReaper::Run() {
  auto wait = options_.initial_delay;

  for (;;) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, wait, [this] { return stop_; })) return;
    }
    wait = options_.interval;

    try {
      auto stats = RunOnce();
      RELCACHE_LOG_INFO("cleaned expired cache entries",
                        {observability::IntField("entries", static_cast<std::int64_t>(stats.expired_entries)),
                         observability::IntField("messages", static_cast<std::int64_t>(stats.expired_messages))});
    } catch (const std::exception& e) {
      RELCACHE_LOG_ERROR("expiry reaper pass failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace relcache::cache
