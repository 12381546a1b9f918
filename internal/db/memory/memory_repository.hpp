#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace relcache::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and single-process deployments.

  One writer at a time: a transaction holds the writer lock from
  Begin() to Commit()/Rollback() and works on a private snapshot,
  so it is serializable and never fails with a conflict.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  Result LockKey(Transaction&, const std::string& key) override;

  Result UpsertEntry(Transaction&, const model::CacheEntryRecord&, bool keep_live_expiry) override;
  Result InsertEntryIfAbsent(Transaction&, const model::CacheEntryRecord&) override;
  std::optional<model::CacheEntryRecord> GetLiveEntry(Transaction&, const std::string& key, std::int64_t now_ms) override;
  Result DeleteEntry(Transaction&, const std::string& key) override;
  std::uint64_t CountLiveEntries(Transaction&, const std::vector<std::string>& keys, std::int64_t now_ms) override;
  Result UpdateEntryExpiry(Transaction&, const std::string& key, std::int64_t expire_at_ms, std::int64_t now_ms) override;
  Result DeleteExpiredEntries(Transaction&, std::int64_t now_ms) override;

  Result UpsertMapField(Transaction&, const model::MapFieldRecord&) override;
  std::optional<model::MapFieldRecord> GetMapField(Transaction&, const std::string& key, const std::string& field) override;
  Result DeleteMapField(Transaction&, const std::string& key, const std::string& field) override;
  std::vector<model::MapFieldRecord> ListMapFields(Transaction&, const std::string& key) override;
  std::vector<model::MapFieldRecord> ScanMapFields(Transaction&, const std::string& key,
                                                   const std::optional<std::string>& like_pattern,
                                                   std::uint64_t offset, std::uint64_t limit) override;

  Result AppendMessage(Transaction&, model::MessageRecord&) override;
  std::vector<model::MessageRecord> ReadMessages(Transaction&, const std::string& channel, std::int64_t after_id,
                                                 std::uint64_t limit) override;
  Result DeleteMessagesOlderThan(Transaction&, std::int64_t created_before_ms) override;

  Result UpsertSubscription(Transaction&, const model::SubscriptionRecord&) override;
  std::optional<model::SubscriptionRecord> GetSubscription(Transaction&, const std::string& channel,
                                                           const std::string& subscriber) override;
  Result UpdateSubscriptionCursor(Transaction&, const std::string& channel, const std::string& subscriber,
                                  std::int64_t last_message_id, std::int64_t now_ms) override;
  Result DeleteSubscription(Transaction&, const std::string& channel, const std::string& subscriber) override;

  // SQL LIKE with '%', '_' and '\' escape; case sensitive.
  static bool LikeMatch(const std::string& pattern, const std::string& text);

private:
  friend class MemoryTransaction;

  using FieldKey = std::pair<std::string, std::string>;

  struct State {
    std::map<std::string, model::CacheEntryRecord> entries;
    std::map<FieldKey, model::MapFieldRecord> map_fields; // (key, field) order
    std::vector<model::MessageRecord> messages;            // id order
    std::map<FieldKey, model::SubscriptionRecord> subscriptions;

    std::int64_t next_entry_id = 1;
    std::int64_t next_message_id = 1;
  };

  std::mutex writer_mutex_; // held for a transaction's lifetime
  std::mutex mutex_;        // guards committed_
  State committed_;
};

}
