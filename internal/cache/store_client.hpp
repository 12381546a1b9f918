#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/cache/client.hpp"
#include "internal/cache/reaper.hpp"
#include "internal/cache/subscription.hpp"
#include "internal/db/api/repository.hpp"

namespace relcache::cache {

/*
  Client implementation over a db::Repository.

  A top-level StoreClient runs every call in its own transaction.
  The client Transaction() hands to fn is bound to the open
  transaction instead, and a nested Transaction() on it joins.

  db::Result failures and db::DbError both surface as
  util::StoreError("<op>: <message>").
*/
class StoreClient final : public Client {
 public:
  explicit StoreClient(std::shared_ptr<db::Repository> repository, SubscriptionOptions subscription_options = {});

  using Client::Set;

  void                      Set(const std::string& key, std::string_view value, std::chrono::milliseconds ttl) override;
  std::vector<std::uint8_t> GetBytes(const std::string& key) override;
  std::string               GetString(const std::string& key) override;
  std::int64_t              Delete(const std::string& key) override;
  std::int64_t              Count(const std::vector<std::string>& keys) override;

  void SetMapField(const std::string& key, const std::string& field, const std::string& value) override;
  std::string GetMapField(const std::string& key, const std::string& field) override;
  void DeleteMapField(const std::string& key, const std::string& field) override;
  std::map<std::string, std::string> GetMap(const std::string& key) override;
  ScanPage ScanMapStream(const std::string& key, std::uint64_t cursor, const std::string& match,
                         std::int64_t count) override;

  bool SetNX(const std::string& key, std::string_view value, std::chrono::milliseconds ttl) override;
  bool Expire(const std::string& key, std::chrono::milliseconds ttl) override;

  void Transaction(const std::function<void(Context&)>& fn) override;

  void                          Publish(const std::string& channel, const std::string& message) override;
  std::unique_ptr<Subscription> Subscribe(const std::string& channel) override;

  // Stops the attached reaper. Idempotent; no-op on a bound client.
  void Close() override;

  // Reaper stopped by Close().
  void SetReaper(std::shared_ptr<ExpiryReaper> reaper);

  bool InTransaction() const {
    return tx_ != nullptr;
  }

  // Glob ('*', '?') to LIKE with '\' escape; nullopt for an empty match.
  static std::optional<std::string> GlobToLike(const std::string& match);

  // Absolute expiry for a relative ttl; kNoExpiry maps to the sentinel.
  static std::int64_t ExpireAt(std::int64_t now_ms, std::chrono::milliseconds ttl);

 private:
  class BoundContext;

  StoreClient(std::shared_ptr<db::Repository> repository, SubscriptionOptions subscription_options,
              db::Transaction* tx);

  template <typename Fn>
  auto Run(const char* op, Fn&& fn);

  void LockKey(const std::string& key);

  std::shared_ptr<db::Repository> repository_;
  SubscriptionOptions             subscription_options_;
  db::Transaction*                tx_ = nullptr; // set on transaction-bound clients

  std::mutex                    mutex_;
  std::shared_ptr<ExpiryReaper> reaper_;
  bool                          closed_ = false;
};

} // namespace relcache::cache
