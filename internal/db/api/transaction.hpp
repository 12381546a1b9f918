#pragma once

namespace relcache::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Writers are serialized strongly enough for read-modify-write
    when combined with Repository::LockKey()

  SQLite: BEGIN IMMEDIATE on a pooled connection
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot copy-on-write under the writer lock

  Begin/Commit failures throw db::DbError.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once committed or rolled back
  virtual bool IsCommitted() const = 0;
};

}
