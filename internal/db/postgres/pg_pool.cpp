#include "pg_pool.hpp"

namespace relcache::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // seed 0 for key locks, seed 1 for channel locks
  conn.prepare("lock_key", "SELECT pg_advisory_xact_lock(hashtextextended($1, 0))");
  conn.prepare("lock_channel", "SELECT pg_advisory_xact_lock(hashtextextended($1, 1))");

  conn.prepare("upsert_entry",
               "INSERT INTO cache_entries(cache_key,cache_value,expire_at_ms,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$4) "
               "ON CONFLICT(cache_key) DO UPDATE SET "
               "cache_value=EXCLUDED.cache_value, "
               "expire_at_ms=CASE WHEN $5::boolean AND cache_entries.expire_at_ms>$4 "
               "THEN cache_entries.expire_at_ms ELSE EXCLUDED.expire_at_ms END, "
               "updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("insert_entry_if_absent",
               "INSERT INTO cache_entries(cache_key,cache_value,expire_at_ms,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$4) "
               "ON CONFLICT(cache_key) DO UPDATE SET "
               "cache_value=EXCLUDED.cache_value, expire_at_ms=EXCLUDED.expire_at_ms, "
               "created_at_ms=EXCLUDED.created_at_ms, updated_at_ms=EXCLUDED.updated_at_ms "
               "WHERE cache_entries.expire_at_ms<=$4");

  conn.prepare("get_live_entry",
               "SELECT id,cache_key,cache_value,expire_at_ms,created_at_ms,updated_at_ms "
               "FROM cache_entries WHERE cache_key=$1 AND expire_at_ms>$2");

  conn.prepare("delete_entry", "DELETE FROM cache_entries WHERE cache_key=$1");

  conn.prepare("count_live_entries", "SELECT COUNT(*) FROM cache_entries WHERE expire_at_ms>$1");

  conn.prepare("count_live_keys",
               "SELECT COUNT(*) FROM cache_entries WHERE expire_at_ms>$1 AND cache_key=ANY($2::text[])");

  conn.prepare("update_entry_expiry",
               "UPDATE cache_entries SET expire_at_ms=$2,updated_at_ms=$3 "
               "WHERE cache_key=$1 AND expire_at_ms>$3");

  conn.prepare("delete_expired_entries", "DELETE FROM cache_entries WHERE expire_at_ms<=$1");

  conn.prepare("upsert_map_field",
               "INSERT INTO cache_map_fields(cache_key,cache_field,cache_value,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$4) "
               "ON CONFLICT(cache_key,cache_field) DO UPDATE SET "
               "cache_value=EXCLUDED.cache_value, updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_map_field",
               "SELECT cache_key,cache_field,cache_value,created_at_ms,updated_at_ms "
               "FROM cache_map_fields WHERE cache_key=$1 AND cache_field=$2");

  conn.prepare("delete_map_field", "DELETE FROM cache_map_fields WHERE cache_key=$1 AND cache_field=$2");

  conn.prepare("list_map_fields",
               "SELECT cache_key,cache_field,cache_value,created_at_ms,updated_at_ms "
               "FROM cache_map_fields WHERE cache_key=$1 ORDER BY cache_field ASC");

  conn.prepare("scan_map_fields",
               "SELECT cache_key,cache_field,cache_value,created_at_ms,updated_at_ms "
               "FROM cache_map_fields WHERE cache_key=$1 "
               "AND ($2::text IS NULL OR cache_field LIKE $2::text ESCAPE '\\') "
               "ORDER BY cache_field ASC LIMIT $3 OFFSET $4");

  conn.prepare("insert_message",
               "INSERT INTO cache_messages(channel,message,created_at_ms) VALUES($1,$2,$3) RETURNING id");

  conn.prepare("read_messages",
               "SELECT id,channel,message,created_at_ms FROM cache_messages "
               "WHERE channel=$1 AND id>$2 ORDER BY id ASC LIMIT $3");

  conn.prepare("delete_messages_older_than", "DELETE FROM cache_messages WHERE created_at_ms<$1");

  conn.prepare("upsert_subscription",
               "INSERT INTO cache_message_subscriptions(channel,subscriber,last_message_id,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$4) "
               "ON CONFLICT(channel,subscriber) DO UPDATE SET "
               "last_message_id=EXCLUDED.last_message_id, updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_subscription",
               "SELECT channel,subscriber,last_message_id,created_at_ms,updated_at_ms "
               "FROM cache_message_subscriptions WHERE channel=$1 AND subscriber=$2");

  conn.prepare("update_subscription_cursor",
               "UPDATE cache_message_subscriptions SET last_message_id=$3,updated_at_ms=$4 "
               "WHERE channel=$1 AND subscriber=$2");

  conn.prepare("delete_subscription",
               "DELETE FROM cache_message_subscriptions WHERE channel=$1 AND subscriber=$2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    // a dead connection is dropped instead of recycled
    if (!conn->is_open()) {
      delete conn;
      --live_connections_;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace relcache::db::postgres
