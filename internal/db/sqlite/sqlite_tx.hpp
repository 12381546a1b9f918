#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_pool.hpp"

namespace relcache::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - serializes read-modify-write (counters) across connections
      and processes without extra locking
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqlitePool> pool);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return conn_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> conn_;
  bool committed_ = false;
};

}
