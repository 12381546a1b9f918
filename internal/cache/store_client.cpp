#include "store_client.hpp"

#include <limits>
#include <type_traits>

#include "internal/db/model/cache_entry_record.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relcache::cache {

namespace {

void Check(const char* op, const db::Result& r) {
  if (!r) throw util::StoreError(r.code, std::string(op) + ": " + r.message);
}

void ValidateTtl(const char* op, std::chrono::milliseconds ttl) {
  if (ttl.count() < 0) {
    throw util::ValidationError(std::string(op) + ": ttl must not be negative, got " + std::to_string(ttl.count()) +
                                "ms");
  }
}

} // namespace

class StoreClient::BoundContext final : public Context {
 public:
  explicit BoundContext(StoreClient& client) : client_(client) {
  }

  Client& Get() override {
    return client_;
  }

  void LockKey(const std::string& key) override {
    client_.LockKey(key);
  }

 private:
  StoreClient& client_;
};

StoreClient::StoreClient(std::shared_ptr<db::Repository> repository, SubscriptionOptions subscription_options)
    : StoreClient(std::move(repository), subscription_options, nullptr) {
}

StoreClient::StoreClient(std::shared_ptr<db::Repository> repository, SubscriptionOptions subscription_options,
                         db::Transaction* tx)
    : repository_(std::move(repository)), subscription_options_(subscription_options), tx_(tx) {
}

template <typename Fn>
auto StoreClient::Run(const char* op, Fn&& fn) {
  try {
    if (tx_ != nullptr) return fn(*tx_);

    auto tx = repository_->Begin();
    if constexpr (std::is_void_v<decltype(fn(*tx))>) {
      fn(*tx);
      tx->Commit();
    } else {
      auto out = fn(*tx);
      tx->Commit();
      return out;
    }
  } catch (const db::DbError& e) {
    throw util::StoreError(e.code(), std::string(op) + ": " + e.what());
  }
}

std::optional<std::string> StoreClient::GlobToLike(const std::string& match) {
  if (match.empty()) return std::nullopt;

  std::string like;
  like.reserve(match.size());
  for (char c : match) {
    switch (c) {
      case '*':
        like.push_back('%');
        break;
      case '?':
        like.push_back('_');
        break;
      case '%':
      case '_':
      case '\\':
        like.push_back('\\');
        like.push_back(c);
        break;
      default:
        like.push_back(c);
    }
  }
  return like;
}

std::int64_t StoreClient::ExpireAt(std::int64_t now_ms, std::chrono::milliseconds ttl) {
  if (ttl == kNoExpiry) return db::model::kNeverExpireMs;
  if (ttl.count() >= db::model::kNeverExpireMs - now_ms) return db::model::kNeverExpireMs;
  return now_ms + ttl.count();
}

// ------------------------------------------------------------------
// Scalar entries
// ------------------------------------------------------------------

void StoreClient::Set(const std::string& key, std::string_view value, std::chrono::milliseconds ttl) {
  const bool keep_ttl = ttl == kKeepTtl;
  if (!keep_ttl) ValidateTtl("set", ttl);

  db::model::CacheEntryRecord record;
  record.key           = key;
  record.value         = std::string(value);
  record.updated_at_ms = util::NowMs();
  record.expire_at_ms  = keep_ttl ? db::model::kNeverExpireMs : ExpireAt(record.updated_at_ms, ttl);

  Run("set", [&](db::Transaction& tx) { Check("set", repository_->UpsertEntry(tx, record, keep_ttl)); });
}

std::vector<std::uint8_t> StoreClient::GetBytes(const std::string& key) {
  auto value = GetString(key);
  return std::vector<std::uint8_t>(value.begin(), value.end());
}

std::string StoreClient::GetString(const std::string& key) {
  auto entry = Run("get", [&](db::Transaction& tx) { return repository_->GetLiveEntry(tx, key, util::NowMs()); });
  if (!entry) throw util::NotFound("key not found: " + key);
  return std::move(entry->value);
}

std::int64_t StoreClient::Delete(const std::string& key) {
  return Run("delete", [&](db::Transaction& tx) {
    auto r = repository_->DeleteEntry(tx, key);
    Check("delete", r);
    return static_cast<std::int64_t>(r.rows_affected);
  });
}

std::int64_t StoreClient::Count(const std::vector<std::string>& keys) {
  return Run("count", [&](db::Transaction& tx) {
    return static_cast<std::int64_t>(repository_->CountLiveEntries(tx, keys, util::NowMs()));
  });
}

bool StoreClient::SetNX(const std::string& key, std::string_view value, std::chrono::milliseconds ttl) {
  ValidateTtl("setnx", ttl);

  db::model::CacheEntryRecord record;
  record.key           = key;
  record.value         = std::string(value);
  record.updated_at_ms = util::NowMs();
  record.expire_at_ms  = ExpireAt(record.updated_at_ms, ttl);

  return Run("setnx", [&](db::Transaction& tx) {
    auto r = repository_->InsertEntryIfAbsent(tx, record);
    Check("setnx", r);
    return r.rows_affected == 1;
  });
}

bool StoreClient::Expire(const std::string& key, std::chrono::milliseconds ttl) {
  ValidateTtl("expire", ttl);

  return Run("expire", [&](db::Transaction& tx) {
    auto now_ms = util::NowMs();
    auto r      = repository_->UpdateEntryExpiry(tx, key, ExpireAt(now_ms, ttl), now_ms);
    Check("expire", r);
    return r.rows_affected == 1;
  });
}

// ------------------------------------------------------------------
// Map fields
// ------------------------------------------------------------------

void StoreClient::SetMapField(const std::string& key, const std::string& field, const std::string& value) {
  db::model::MapFieldRecord record;
  record.key           = key;
  record.field         = field;
  record.value         = value;
  record.updated_at_ms = util::NowMs();

  Run("hset", [&](db::Transaction& tx) { Check("hset", repository_->UpsertMapField(tx, record)); });
}

std::string StoreClient::GetMapField(const std::string& key, const std::string& field) {
  auto record = Run("hget", [&](db::Transaction& tx) { return repository_->GetMapField(tx, key, field); });
  if (!record) throw util::NotFound("field not found: " + key + "/" + field);
  return std::move(record->value);
}

void StoreClient::DeleteMapField(const std::string& key, const std::string& field) {
  Run("hdel", [&](db::Transaction& tx) { Check("hdel", repository_->DeleteMapField(tx, key, field)); });
}

std::map<std::string, std::string> StoreClient::GetMap(const std::string& key) {
  auto records = Run("hgetall", [&](db::Transaction& tx) { return repository_->ListMapFields(tx, key); });
  if (records.empty()) throw util::NotFound("map not found: " + key);

  std::map<std::string, std::string> out;
  for (auto& r : records) {
    out.emplace(std::move(r.field), std::move(r.value));
  }
  return out;
}

ScanPage StoreClient::ScanMapStream(const std::string& key, std::uint64_t cursor, const std::string& match,
                                    std::int64_t count) {
  const auto page_size = static_cast<std::uint64_t>(count > 0 ? count : kDefaultScanCount);
  const auto like      = GlobToLike(match);

  auto records = Run("hscan", [&](db::Transaction& tx) {
    return repository_->ScanMapFields(tx, key, like, cursor, page_size);
  });

  ScanPage page;
  page.items.reserve(records.size() * 2);
  for (auto& r : records) {
    page.items.push_back(std::move(r.field));
    page.items.push_back(std::move(r.value));
  }
  page.cursor = records.size() < page_size ? 0 : cursor + records.size();
  return page;
}

// ------------------------------------------------------------------
// Transactions
// ------------------------------------------------------------------

void StoreClient::Transaction(const std::function<void(Context&)>& fn) {
  if (tx_ != nullptr) {
    BoundContext ctx(*this);
    fn(ctx);
    return;
  }

  std::unique_ptr<db::Transaction> tx;
  try {
    tx = repository_->Begin();
  } catch (const db::DbError& e) {
    throw util::StoreError(e.code(), std::string("transaction: ") + e.what());
  }

  StoreClient  bound(repository_, subscription_options_, tx.get());
  BoundContext ctx(bound);

  // anything thrown here leaves tx uncommitted; its destructor rolls back
  fn(ctx);

  try {
    tx->Commit();
  } catch (const db::DbError& e) {
    throw util::StoreError(e.code(), std::string("transaction: ") + e.what());
  }
}

void StoreClient::LockKey(const std::string& key) {
  Run("lock", [&](db::Transaction& tx) { Check("lock", repository_->LockKey(tx, key)); });
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

void StoreClient::Publish(const std::string& channel, const std::string& message) {
  db::model::MessageRecord record;
  record.channel       = channel;
  record.payload       = message;
  record.created_at_ms = util::NowMs();

  Run("publish", [&](db::Transaction& tx) { Check("publish", repository_->AppendMessage(tx, record)); });
}

std::unique_ptr<Subscription> StoreClient::Subscribe(const std::string& channel) {
  if (tx_ != nullptr) {
    // the poller runs its own transactions and would wait on this one
    throw util::ValidationError("subscribe: not allowed inside a transaction");
  }
  return std::make_unique<PollingSubscription>(repository_, channel, subscription_options_);
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void StoreClient::SetReaper(std::shared_ptr<ExpiryReaper> reaper) {
  std::lock_guard lock(mutex_);
  reaper_ = std::move(reaper);
}

void StoreClient::Close() {
  if (tx_ != nullptr) return;

  std::shared_ptr<ExpiryReaper> reaper;
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    closed_ = true;
    reaper  = std::move(reaper_);
  }

  if (reaper) reaper->Stop();
}

} // namespace relcache::cache
