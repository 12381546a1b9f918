#include "migrations.hpp"

namespace relcache::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS cache_entries (id INTEGER PRIMARY KEY AUTOINCREMENT, cache_key TEXT NOT NULL UNIQUE, cache_value BLOB NOT NULL, expire_at_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_cache_entries_expire_at ON cache_entries(expire_at_ms);",
      "CREATE TABLE IF NOT EXISTS cache_map_fields (id INTEGER PRIMARY KEY AUTOINCREMENT, cache_key TEXT NOT NULL, cache_field TEXT NOT NULL, cache_value TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, UNIQUE(cache_key, cache_field));",
      "CREATE TABLE IF NOT EXISTS cache_messages (id INTEGER PRIMARY KEY AUTOINCREMENT, channel TEXT NOT NULL, message TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_cache_messages_channel_id ON cache_messages(channel, id);",
      "CREATE TABLE IF NOT EXISTS cache_message_subscriptions (channel TEXT NOT NULL, subscriber TEXT NOT NULL, last_message_id INTEGER NOT NULL DEFAULT -1, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (channel, subscriber));"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS cache_entries (id BIGSERIAL PRIMARY KEY, cache_key VARCHAR(256) NOT NULL UNIQUE, cache_value BYTEA NOT NULL, expire_at_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_cache_entries_expire_at ON cache_entries(expire_at_ms);",
      "CREATE TABLE IF NOT EXISTS cache_map_fields (id BIGSERIAL PRIMARY KEY, cache_key VARCHAR(256) NOT NULL, cache_field VARCHAR(256) NOT NULL, cache_value TEXT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, UNIQUE(cache_key, cache_field));",
      "CREATE TABLE IF NOT EXISTS cache_messages (id BIGSERIAL PRIMARY KEY, channel VARCHAR(1024) NOT NULL, message TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_cache_messages_channel_id ON cache_messages(channel, id);",
      "CREATE TABLE IF NOT EXISTS cache_message_subscriptions (channel VARCHAR(1024) NOT NULL, subscriber VARCHAR(1024) NOT NULL, last_message_id BIGINT NOT NULL DEFAULT -1, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (channel, subscriber));"};
  return kSchema;
}

} // namespace relcache::db::sql
