#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/counter.hpp"
#include "internal/cache/registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#if RELCACHE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RELCACHE_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace relcache::factory {

using namespace relcache;

namespace {

#if RELCACHE_DB_SQLITE
std::shared_ptr<db::Repository> BuildSqlite(const relcache::runtime::config::SqliteConfig& config) {
  db::sqlite::SqliteOptions options;
  options.wal_mode = config.wal_mode();
  if (config.busy_timeout_ms() > 0) options.busy_timeout_ms = config.busy_timeout_ms();

  {
    db::sqlite::SqliteDB bootstrap(config.path(), options);
    db::sql::RunMigrations(bootstrap, db::sql::SqliteSchema());
  }

  const std::size_t max_connections = config.max_connections() > 0 ? config.max_connections() : 8;
  auto              pool = std::make_shared<db::sqlite::SqlitePool>(config.path(), options, max_connections);

  RELCACHE_LOG_INFO("cache backend initialized", {observability::StringField("backend", "sqlite"),
                                                  observability::StringField("path", config.path()),
                                                  observability::BoolField("wal_mode", options.wal_mode)});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
}
#endif

#if RELCACHE_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

std::shared_ptr<db::Repository> BuildPostgres(const relcache::runtime::config::PostgresConfig& config) {
  // schema first: pooled connections prepare statements against it
  try {
    pqxx::connection    conn(config.connection_uri());
    pqxx::work          tx(conn);
    PgMigrationExecutor executor(tx);
    db::sql::RunMigrations(executor, db::sql::PostgresSchema());
    tx.commit();
  } catch (const std::exception& e) {
    throw db::DbError(db::postgres::TranslateCode(e), std::string("postgres bootstrap: ") + e.what());
  }

  const std::size_t max_connections = config.max_connections() > 0 ? config.max_connections() : 16;
  auto              pool = std::make_shared<db::postgres::PgPool>(config.connection_uri(), max_connections);

  RELCACHE_LOG_INFO("cache backend initialized", {observability::StringField("backend", "postgres"),
                                                  observability::IntField("max_connections",
                                                                          static_cast<std::int64_t>(max_connections))});
  return std::make_shared<db::postgres::PgRepository>(std::move(pool));
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const relcache::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RELCACHE_DB_SQLITE
    return BuildSqlite(database.sqlite());
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RELCACHE_DB_POSTGRES
    return BuildPostgres(database.postgres());
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RELCACHE_LOG_INFO("cache backend initialized", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

cache::ReaperOptions ReaperOptionsFrom(const relcache::runtime::config::CacheConfig& cache) {
  cache::ReaperOptions defaults;
  cache::ReaperOptions options;
  options.initial_delay     = util::FromProto(cache.reaper_initial_delay(), defaults.initial_delay);
  options.interval          = util::FromProto(cache.reaper_interval(), defaults.interval);
  options.message_retention = util::FromProto(cache.message_retention(), defaults.message_retention);
  return options;
}

cache::SubscriptionOptions SubscriptionOptionsFrom(const relcache::runtime::config::CacheConfig& cache) {
  cache::SubscriptionOptions options;
  options.poll_interval = util::FromProto(cache.subscribe_poll_interval(), options.poll_interval);
  if (cache.subscribe_batch_size() > 0) options.batch_size = cache.subscribe_batch_size();
  if (cache.subscribe_buffer_size() > 0) options.buffer_size = cache.subscribe_buffer_size();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const relcache::runtime::config::RuntimeConfig& config, bool start_reaper) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Client + adapter
  // ------------------------------------------------------------------
  app.client = std::make_shared<cache::StoreClient>(app.repository, SubscriptionOptionsFrom(config.cache()));

  const int counter_attempts = config.cache().counter_max_attempts() > 0
                                   ? static_cast<int>(config.cache().counter_max_attempts())
                                   : cache::kDefaultCounterAttempts;
  app.commands = std::make_shared<cache::CmdableAdapter>(app.client, counter_attempts);

  // ------------------------------------------------------------------
  // Expiry reaper, stopped by client Close()
  // ------------------------------------------------------------------
  app.reaper = std::make_shared<cache::ExpiryReaper>(app.repository, ReaperOptionsFrom(config.cache()));
  app.client->SetReaper(app.reaper);
  if (start_reaper) app.reaper->Start();

  cache::SetClient(app.client);

  return app;
}

} // namespace relcache::factory
