#pragma once

namespace relcache::db::sql {

/*
  Canonical SQL for the SQLite backend ('?' placeholders).

  The Postgres backend prepares the same statements with $n
  placeholders in PgPool::PrepareStatements.
*/

// scalar entries

static constexpr const char* UPSERT_ENTRY =
    "INSERT INTO cache_entries(cache_key,cache_value,expire_at_ms,created_at_ms,updated_at_ms)"
    " VALUES(?1,?2,?3,?4,?4)"
    " ON CONFLICT(cache_key) DO UPDATE SET"
    " cache_value=excluded.cache_value,"
    " expire_at_ms=CASE WHEN ?5<>0 AND cache_entries.expire_at_ms>?4"
    " THEN cache_entries.expire_at_ms ELSE excluded.expire_at_ms END,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* INSERT_ENTRY_IF_ABSENT =
    "INSERT INTO cache_entries(cache_key,cache_value,expire_at_ms,created_at_ms,updated_at_ms)"
    " VALUES(?1,?2,?3,?4,?4)"
    " ON CONFLICT(cache_key) DO UPDATE SET"
    " cache_value=excluded.cache_value,"
    " expire_at_ms=excluded.expire_at_ms,"
    " created_at_ms=excluded.created_at_ms,"
    " updated_at_ms=excluded.updated_at_ms"
    " WHERE cache_entries.expire_at_ms<=?4;";

static constexpr const char* SELECT_LIVE_ENTRY =
    "SELECT id,cache_key,cache_value,expire_at_ms,created_at_ms,updated_at_ms"
    " FROM cache_entries WHERE cache_key=? AND expire_at_ms>?;";

static constexpr const char* DELETE_ENTRY =
    "DELETE FROM cache_entries WHERE cache_key=?;";

static constexpr const char* COUNT_LIVE_ENTRIES =
    "SELECT COUNT(*) FROM cache_entries WHERE expire_at_ms>?";

static constexpr const char* UPDATE_ENTRY_EXPIRY =
    "UPDATE cache_entries SET expire_at_ms=?,updated_at_ms=?"
    " WHERE cache_key=? AND expire_at_ms>?;";

static constexpr const char* DELETE_EXPIRED_ENTRIES =
    "DELETE FROM cache_entries WHERE expire_at_ms<=?;";

// map fields

static constexpr const char* UPSERT_MAP_FIELD =
    "INSERT INTO cache_map_fields(cache_key,cache_field,cache_value,created_at_ms,updated_at_ms)"
    " VALUES(?1,?2,?3,?4,?4)"
    " ON CONFLICT(cache_key,cache_field) DO UPDATE SET"
    " cache_value=excluded.cache_value,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_MAP_FIELD =
    "SELECT cache_key,cache_field,cache_value,created_at_ms,updated_at_ms"
    " FROM cache_map_fields WHERE cache_key=? AND cache_field=?;";

static constexpr const char* DELETE_MAP_FIELD =
    "DELETE FROM cache_map_fields WHERE cache_key=? AND cache_field=?;";

static constexpr const char* SELECT_MAP_FIELDS =
    "SELECT cache_key,cache_field,cache_value,created_at_ms,updated_at_ms"
    " FROM cache_map_fields WHERE cache_key=? ORDER BY cache_field ASC;";

static constexpr const char* SCAN_MAP_FIELDS =
    "SELECT cache_key,cache_field,cache_value,created_at_ms,updated_at_ms"
    " FROM cache_map_fields WHERE cache_key=?1 AND (?2 IS NULL OR cache_field LIKE ?2 ESCAPE '\\')"
    " ORDER BY cache_field ASC LIMIT ?3 OFFSET ?4;";

// messages

static constexpr const char* INSERT_MESSAGE =
    "INSERT INTO cache_messages(channel,message,created_at_ms) VALUES(?,?,?);";

static constexpr const char* SELECT_MESSAGES_AFTER =
    "SELECT id,channel,message,created_at_ms FROM cache_messages"
    " WHERE channel=? AND id>? ORDER BY id ASC LIMIT ?;";

static constexpr const char* DELETE_MESSAGES_OLDER_THAN =
    "DELETE FROM cache_messages WHERE created_at_ms<?;";

// subscriptions

static constexpr const char* UPSERT_SUBSCRIPTION =
    "INSERT INTO cache_message_subscriptions(channel,subscriber,last_message_id,created_at_ms,updated_at_ms)"
    " VALUES(?1,?2,?3,?4,?4)"
    " ON CONFLICT(channel,subscriber) DO UPDATE SET"
    " last_message_id=excluded.last_message_id,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_SUBSCRIPTION =
    "SELECT channel,subscriber,last_message_id,created_at_ms,updated_at_ms"
    " FROM cache_message_subscriptions WHERE channel=? AND subscriber=?;";

static constexpr const char* UPDATE_SUBSCRIPTION_CURSOR =
    "UPDATE cache_message_subscriptions SET last_message_id=?,updated_at_ms=?"
    " WHERE channel=? AND subscriber=?;";

static constexpr const char* DELETE_SUBSCRIPTION =
    "DELETE FROM cache_message_subscriptions WHERE channel=? AND subscriber=?;";

}
