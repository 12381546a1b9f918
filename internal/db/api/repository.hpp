#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/map_field_record.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/db/model/subscription_record.hpp"

namespace relcache::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All statements run inside a Transaction
  - Reads inside a transaction see its writes
  - Upserts and conditional inserts are single atomic statements,
    never read-then-write
  - Writes return Result (rows_affected filled in)
  - Reads throw DbError on store failure

  Time is passed in explicitly (epoch ms) so every backend
  agrees on "now" for expiry checks.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Exclusive transaction-scoped lock on a key name, released at
  // commit/rollback. Backends whose writers are already serialized
  // may treat this as a no-op.
  virtual Result LockKey(Transaction&, const std::string& key) = 0;

  // ---------------------------------------------------------------------
  // Scalar entries (cache_entries)
  // ---------------------------------------------------------------------

  // Insert or overwrite. r.updated_at_ms is "now". With keep_live_expiry
  // a live row keeps its expire_at_ms and only the value changes.
  virtual Result UpsertEntry(Transaction&, const model::CacheEntryRecord& r, bool keep_live_expiry) = 0;

  // Insert unless a live row holds the key; an expired row is claimed.
  // rows_affected == 1 iff the write happened.
  virtual Result InsertEntryIfAbsent(Transaction&, const model::CacheEntryRecord& r) = 0;

  virtual std::optional<model::CacheEntryRecord> GetLiveEntry(Transaction&, const std::string& key, std::int64_t now_ms) = 0;

  virtual Result DeleteEntry(Transaction&, const std::string& key) = 0;

  // Empty keys counts every live entry.
  virtual std::uint64_t CountLiveEntries(Transaction&, const std::vector<std::string>& keys, std::int64_t now_ms) = 0;

  // Only live rows are touched.
  virtual Result UpdateEntryExpiry(Transaction&, const std::string& key, std::int64_t expire_at_ms, std::int64_t now_ms) = 0;

  virtual Result DeleteExpiredEntries(Transaction&, std::int64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Map fields (cache_map_fields)
  // ---------------------------------------------------------------------

  virtual Result UpsertMapField(Transaction&, const model::MapFieldRecord& r) = 0;

  virtual std::optional<model::MapFieldRecord> GetMapField(Transaction&, const std::string& key, const std::string& field) = 0;

  virtual Result DeleteMapField(Transaction&, const std::string& key, const std::string& field) = 0;

  virtual std::vector<model::MapFieldRecord> ListMapFields(Transaction&, const std::string& key) = 0;

  // Ordered by field. like_pattern uses SQL LIKE syntax with '\' escape.
  virtual std::vector<model::MapFieldRecord> ScanMapFields(Transaction&, const std::string& key,
                                                           const std::optional<std::string>& like_pattern,
                                                           std::uint64_t offset, std::uint64_t limit) = 0;

  // ---------------------------------------------------------------------
  // Message log + subscriptions
  // ---------------------------------------------------------------------

  // Assigns r.id. Ids within a channel are handed out in commit order.
  virtual Result AppendMessage(Transaction&, model::MessageRecord& r) = 0;

  virtual std::vector<model::MessageRecord> ReadMessages(Transaction&, const std::string& channel, std::int64_t after_id,
                                                         std::uint64_t limit) = 0;

  virtual Result DeleteMessagesOlderThan(Transaction&, std::int64_t created_before_ms) = 0;

  virtual Result UpsertSubscription(Transaction&, const model::SubscriptionRecord& r) = 0;

  virtual std::optional<model::SubscriptionRecord> GetSubscription(Transaction&, const std::string& channel,
                                                                   const std::string& subscriber) = 0;

  virtual Result UpdateSubscriptionCursor(Transaction&, const std::string& channel, const std::string& subscriber,
                                          std::int64_t last_message_id, std::int64_t now_ms) = 0;

  virtual Result DeleteSubscription(Transaction&, const std::string& channel, const std::string& subscriber) = 0;
};

} // namespace relcache::db
