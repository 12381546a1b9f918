#include "sqlite_tx.hpp"

namespace relcache::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqlitePool> pool) : conn_(pool->Acquire()) {
  conn_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    // best effort; the connection returns to the pool either way
    sqlite3_exec(conn_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  conn_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  conn_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace relcache::db::sqlite
