#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace relcache::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

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

private:
  std::shared_ptr<SqlitePool> pool_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
