#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace relcache::db::sqlite {

/*
  SqlitePool

  Hands out one connection per transaction. A sqlite3 connection
  carries its own transaction state, so two concurrent transactions
  can never share one.

  Writers still serialize on the database file lock (BEGIN IMMEDIATE
  + busy timeout); the pool only bounds how many callers wait on it.
*/
class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  SqlitePool(std::string path, SqliteOptions options, std::size_t max_connections = 8);

  std::shared_ptr<SqliteDB> Acquire();

  const std::string& Path() const {
    return path_;
  }

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string   path_;
  SqliteOptions options_;
  std::size_t   max_connections_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace relcache::db::sqlite
