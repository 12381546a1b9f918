#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/migrations.hpp"

namespace relcache::db::sqlite {

struct SqliteOptions {
  bool wal_mode        = true;
  int  busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around one sqlite3* connection.

  A connection is used by one transaction at a time; SqlitePool
  hands them out.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  SqliteDB(std::string path, SqliteOptions options);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control).
  // Throws DbError.
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  static ErrorCode TranslateCode(int rc);

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace relcache::db::sqlite
