#include "pg_repository.hpp"

#include <cstddef>

namespace relcache::db::postgres {

namespace {

std::string FromBytes(const pqxx::field& f) {
  auto bytes = f.as<std::basic_string<std::byte>>();
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

model::CacheEntryRecord ReadEntry(const pqxx::row& row) {
  model::CacheEntryRecord r;
  r.id            = row[0].as<std::int64_t>();
  r.key           = row[1].c_str();
  r.value         = FromBytes(row[2]);
  r.expire_at_ms  = row[3].as<std::int64_t>();
  r.created_at_ms = row[4].as<std::int64_t>();
  r.updated_at_ms = row[5].as<std::int64_t>();
  return r;
}

model::MapFieldRecord ReadMapField(const pqxx::row& row) {
  model::MapFieldRecord r;
  r.key           = row[0].c_str();
  r.field         = row[1].c_str();
  r.value         = row[2].as<std::string>();
  r.created_at_ms = row[3].as<std::int64_t>();
  r.updated_at_ms = row[4].as<std::int64_t>();
  return r;
}

std::vector<model::MapFieldRecord> ReadMapFields(const pqxx::result& res) {
  std::vector<model::MapFieldRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadMapField(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  return Result::Err(TranslateCode(e), e.what());
}

void PgRepository::Rethrow(const std::exception& e) {
  throw DbError(TranslateCode(e), e.what());
}

Result PgRepository::LockKey(Transaction& t, const std::string& key) {
  try {
    TX(t).Work().exec_prepared("lock_key", key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Scalar entries
// ------------------------------------------------------------------

Result PgRepository::UpsertEntry(Transaction& t, const model::CacheEntryRecord& r, bool keep_live_expiry) {
  try {
    auto res = TX(t).Work().exec_prepared("upsert_entry", r.key, pqxx::binary_cast(r.value), r.expire_at_ms,
                                          r.updated_at_ms, keep_live_expiry);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertEntryIfAbsent(Transaction& t, const model::CacheEntryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_entry_if_absent", r.key, pqxx::binary_cast(r.value), r.expire_at_ms,
                                          r.updated_at_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CacheEntryRecord> PgRepository::GetLiveEntry(Transaction& t, const std::string& key,
                                                                  std::int64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("get_live_entry", key, now_ms);
    if (res.empty()) return std::nullopt;
    return ReadEntry(res[0]);
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

Result PgRepository::DeleteEntry(Transaction& t, const std::string& key) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_entry", key);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::uint64_t PgRepository::CountLiveEntries(Transaction& t, const std::vector<std::string>& keys, std::int64_t now_ms) {
  try {
    auto res = keys.empty() ? TX(t).Work().exec_prepared("count_live_entries", now_ms)
                            : TX(t).Work().exec_prepared("count_live_keys", now_ms, keys);
    return res[0][0].as<std::uint64_t>();
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

Result PgRepository::UpdateEntryExpiry(Transaction& t, const std::string& key, std::int64_t expire_at_ms,
                                       std::int64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("update_entry_expiry", key, expire_at_ms, now_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredEntries(Transaction& t, std::int64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_expired_entries", now_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Map fields
// ------------------------------------------------------------------

Result PgRepository::UpsertMapField(Transaction& t, const model::MapFieldRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("upsert_map_field", r.key, r.field, r.value, r.updated_at_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MapFieldRecord> PgRepository::GetMapField(Transaction& t, const std::string& key,
                                                               const std::string& field) {
  try {
    auto res = TX(t).Work().exec_prepared("get_map_field", key, field);
    if (res.empty()) return std::nullopt;
    return ReadMapField(res[0]);
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

Result PgRepository::DeleteMapField(Transaction& t, const std::string& key, const std::string& field) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_map_field", key, field);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MapFieldRecord> PgRepository::ListMapFields(Transaction& t, const std::string& key) {
  try {
    return ReadMapFields(TX(t).Work().exec_prepared("list_map_fields", key));
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

std::vector<model::MapFieldRecord> PgRepository::ScanMapFields(Transaction& t, const std::string& key,
                                                               const std::optional<std::string>& like_pattern,
                                                               std::uint64_t offset, std::uint64_t limit) {
  try {
    return ReadMapFields(TX(t).Work().exec_prepared("scan_map_fields", key, like_pattern,
                                                    static_cast<std::int64_t>(limit),
                                                    static_cast<std::int64_t>(offset)));
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result PgRepository::AppendMessage(Transaction& t, model::MessageRecord& r) {
  try {
    auto& work = TX(t).Work();
    // serialize appenders per channel so ids become visible in commit order
    work.exec_prepared("lock_channel", r.channel);
    auto res = work.exec_prepared("insert_message", r.channel, r.payload, r.created_at_ms);
    r.id     = res[0][0].as<std::int64_t>();
    return Result::Ok(1);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MessageRecord> PgRepository::ReadMessages(Transaction& t, const std::string& channel,
                                                             std::int64_t after_id, std::uint64_t limit) {
  try {
    auto res = TX(t).Work().exec_prepared("read_messages", channel, after_id, static_cast<std::int64_t>(limit));

    std::vector<model::MessageRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::MessageRecord m;
      m.id            = row[0].as<std::int64_t>();
      m.channel       = row[1].c_str();
      m.payload       = row[2].as<std::string>();
      m.created_at_ms = row[3].as<std::int64_t>();
      out.push_back(std::move(m));
    }
    return out;
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

Result PgRepository::DeleteMessagesOlderThan(Transaction& t, std::int64_t created_before_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_messages_older_than", created_before_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result PgRepository::UpsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("upsert_subscription", r.channel, r.subscriber, r.last_message_id,
                                          r.updated_at_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SubscriptionRecord> PgRepository::GetSubscription(Transaction& t, const std::string& channel,
                                                                       const std::string& subscriber) {
  try {
    auto res = TX(t).Work().exec_prepared("get_subscription", channel, subscriber);
    if (res.empty()) return std::nullopt;

    model::SubscriptionRecord r;
    r.channel         = res[0][0].c_str();
    r.subscriber      = res[0][1].c_str();
    r.last_message_id = res[0][2].as<std::int64_t>();
    r.created_at_ms   = res[0][3].as<std::int64_t>();
    r.updated_at_ms   = res[0][4].as<std::int64_t>();
    return r;
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

Result PgRepository::UpdateSubscriptionCursor(Transaction& t, const std::string& channel, const std::string& subscriber,
                                              std::int64_t last_message_id, std::int64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("update_subscription_cursor", channel, subscriber, last_message_id, now_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSubscription(Transaction& t, const std::string& channel, const std::string& subscriber) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_subscription", channel, subscriber);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

}
