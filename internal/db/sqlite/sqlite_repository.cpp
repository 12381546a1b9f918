#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace relcache::db::sqlite {

using relcache::db::ErrorCode;
using relcache::db::Result;

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Stmt Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        return Stmt(nullptr, &sqlite3_finalize);
    }
    return Stmt(st, &sqlite3_finalize);
}

// reads have no Result to carry the failure
Stmt PrepareOrThrow(sqlite3* db, const char* sql) {
    auto st = Prepare(db, sql);
    if (!st) throw DbError(ErrorCode::InternalError, std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    return st;
}

void ThrowStepError(sqlite3* db, int rc) {
    throw DbError(SqliteDB::TranslateCode(rc), std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    return b ? std::string(static_cast<const char*>(b), sqlite3_column_bytes(st, col)) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

model::CacheEntryRecord ReadEntry(sqlite3_stmt* st) {
    model::CacheEntryRecord r;
    r.id = ColI64(st, 0);
    r.key = ColText(st, 1);
    r.value = ColBlob(st, 2);
    r.expire_at_ms = ColI64(st, 3);
    r.created_at_ms = ColI64(st, 4);
    r.updated_at_ms = ColI64(st, 5);
    return r;
}

model::MapFieldRecord ReadMapField(sqlite3_stmt* st) {
    model::MapFieldRecord r;
    r.key = ColText(st, 0);
    r.field = ColText(st, 1);
    r.value = ColText(st, 2);
    r.created_at_ms = ColI64(st, 3);
    r.updated_at_ms = ColI64(st, 4);
    return r;
}

std::vector<model::MapFieldRecord> ReadMapFields(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::MapFieldRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadMapField(st));
    }
    if (rc != SQLITE_DONE) ThrowStepError(db, rc);
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool)
    : pool_(std::move(pool)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(pool_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok(static_cast<std::uint64_t>(sqlite3_changes(db)));

    return Result::Err(SqliteDB::TranslateCode(rc), sqlite3_errmsg(db));
}

Result SqliteRepository::LockKey(Transaction&, const std::string&) {
    // BEGIN IMMEDIATE already holds the database write lock
    return Result::Ok();
}

// ------------------------------------------------------------------
// Scalar entries
// ------------------------------------------------------------------

Result SqliteRepository::UpsertEntry(Transaction& t, const model::CacheEntryRecord& r, bool keep_live_expiry) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::UPSERT_ENTRY);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.key);
    BindBlob(st.get(), 2, r.value);
    BindI64(st.get(), 3, r.expire_at_ms);
    BindI64(st.get(), 4, r.updated_at_ms);
    BindI64(st.get(), 5, keep_live_expiry ? 1 : 0);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertEntryIfAbsent(Transaction& t, const model::CacheEntryRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::INSERT_ENTRY_IF_ABSENT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.key);
    BindBlob(st.get(), 2, r.value);
    BindI64(st.get(), 3, r.expire_at_ms);
    BindI64(st.get(), 4, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CacheEntryRecord>
SqliteRepository::GetLiveEntry(Transaction& t, const std::string& key, std::int64_t now_ms) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_LIVE_ENTRY);
    BindText(st.get(), 1, key);
    BindI64(st.get(), 2, now_ms);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowStepError(db, rc);

    return ReadEntry(st.get());
}

Result SqliteRepository::DeleteEntry(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::DELETE_ENTRY);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, key);
    return Translate(db, sqlite3_step(st.get()));
}

std::uint64_t SqliteRepository::CountLiveEntries(Transaction& t, const std::vector<std::string>& keys, std::int64_t now_ms) {
    auto* db = TX(t).Handle();

    std::string sql = sql::COUNT_LIVE_ENTRIES;
    if (!keys.empty()) {
        sql += " AND cache_key IN (";
        for (std::size_t i = 0; i < keys.size(); ++i) {
            sql += i == 0 ? "?" : ",?";
        }
        sql += ")";
    }
    sql += ";";

    auto st = PrepareOrThrow(db, sql.c_str());
    int bind_idx = 1;
    BindI64(st.get(), bind_idx++, now_ms);
    for (const auto& key : keys) {
        BindText(st.get(), bind_idx++, key);
    }

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) ThrowStepError(db, rc);
    return static_cast<std::uint64_t>(ColI64(st.get(), 0));
}

Result SqliteRepository::UpdateEntryExpiry(Transaction& t, const std::string& key, std::int64_t expire_at_ms,
                                           std::int64_t now_ms) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::UPDATE_ENTRY_EXPIRY);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, expire_at_ms);
    BindI64(st.get(), 2, now_ms);
    BindText(st.get(), 3, key);
    BindI64(st.get(), 4, now_ms);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteExpiredEntries(Transaction& t, std::int64_t now_ms) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::DELETE_EXPIRED_ENTRIES);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, now_ms);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Map fields
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMapField(Transaction& t, const model::MapFieldRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::UPSERT_MAP_FIELD);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.key);
    BindText(st.get(), 2, r.field);
    BindText(st.get(), 3, r.value);
    BindI64(st.get(), 4, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MapFieldRecord>
SqliteRepository::GetMapField(Transaction& t, const std::string& key, const std::string& field) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_MAP_FIELD);
    BindText(st.get(), 1, key);
    BindText(st.get(), 2, field);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowStepError(db, rc);

    return ReadMapField(st.get());
}

Result SqliteRepository::DeleteMapField(Transaction& t, const std::string& key, const std::string& field) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::DELETE_MAP_FIELD);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, key);
    BindText(st.get(), 2, field);
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::MapFieldRecord> SqliteRepository::ListMapFields(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_MAP_FIELDS);
    BindText(st.get(), 1, key);
    return ReadMapFields(db, st.get());
}

std::vector<model::MapFieldRecord> SqliteRepository::ScanMapFields(Transaction& t, const std::string& key,
                                                                   const std::optional<std::string>& like_pattern,
                                                                   std::uint64_t offset, std::uint64_t limit) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SCAN_MAP_FIELDS);
    BindText(st.get(), 1, key);
    if (like_pattern.has_value()) {
        BindText(st.get(), 2, *like_pattern);
    } else {
        sqlite3_bind_null(st.get(), 2);
    }
    BindI64(st.get(), 3, static_cast<std::int64_t>(limit));
    BindI64(st.get(), 4, static_cast<std::int64_t>(offset));
    return ReadMapFields(db, st.get());
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result SqliteRepository::AppendMessage(Transaction& t, model::MessageRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::INSERT_MESSAGE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.channel);
    BindText(st.get(), 2, r.payload);
    BindI64(st.get(), 3, r.created_at_ms);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
        return Translate(db, rc);
    }

    // single writer under BEGIN IMMEDIATE: ids come out in commit order
    r.id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok(1);
}

std::vector<model::MessageRecord> SqliteRepository::ReadMessages(Transaction& t, const std::string& channel,
                                                                 std::int64_t after_id, std::uint64_t limit) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_MESSAGES_AFTER);
    BindText(st.get(), 1, channel);
    BindI64(st.get(), 2, after_id);
    BindI64(st.get(), 3, static_cast<std::int64_t>(limit));

    std::vector<model::MessageRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::MessageRecord m;
        m.id = ColI64(st.get(), 0);
        m.channel = ColText(st.get(), 1);
        m.payload = ColText(st.get(), 2);
        m.created_at_ms = ColI64(st.get(), 3);
        out.push_back(std::move(m));
    }
    if (rc != SQLITE_DONE) ThrowStepError(db, rc);
    return out;
}

Result SqliteRepository::DeleteMessagesOlderThan(Transaction& t, std::int64_t created_before_ms) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::DELETE_MESSAGES_OLDER_THAN);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, created_before_ms);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::UPSERT_SUBSCRIPTION);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.channel);
    BindText(st.get(), 2, r.subscriber);
    BindI64(st.get(), 3, r.last_message_id);
    BindI64(st.get(), 4, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SubscriptionRecord> SqliteRepository::GetSubscription(Transaction& t, const std::string& channel,
                                                                           const std::string& subscriber) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_SUBSCRIPTION);
    BindText(st.get(), 1, channel);
    BindText(st.get(), 2, subscriber);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowStepError(db, rc);

    model::SubscriptionRecord r;
    r.channel = ColText(st.get(), 0);
    r.subscriber = ColText(st.get(), 1);
    r.last_message_id = ColI64(st.get(), 2);
    r.created_at_ms = ColI64(st.get(), 3);
    r.updated_at_ms = ColI64(st.get(), 4);
    return r;
}

Result SqliteRepository::UpdateSubscriptionCursor(Transaction& t, const std::string& channel,
                                                  const std::string& subscriber, std::int64_t last_message_id,
                                                  std::int64_t now_ms) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::UPDATE_SUBSCRIPTION_CURSOR);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, last_message_id);
    BindI64(st.get(), 2, now_ms);
    BindText(st.get(), 3, channel);
    BindText(st.get(), 4, subscriber);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteSubscription(Transaction& t, const std::string& channel, const std::string& subscriber) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::DELETE_SUBSCRIPTION);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, channel);
    BindText(st.get(), 2, subscriber);
    return Translate(db, sqlite3_step(st.get()));
}

}
