#include "pg_tx.hpp"

namespace relcache::db::postgres {

ErrorCode TranslateCode(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return ErrorCode::SerializationFailure;
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return ErrorCode::SerializationFailure;
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return ErrorCode::AlreadyExists;
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return ErrorCode::ConstraintViolation;
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return ErrorCode::IOError;
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e)) return ErrorCode::IOError;
  return ErrorCode::InternalError;
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  try {
    conn_ = pool->Acquire();
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const DbError&) {
    throw;
  } catch (const std::exception& e) {
    throw DbError(TranslateCode(e), std::string("postgres begin: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!committed_ && tx_) {
    try { tx_->abort(); }
    catch (const std::exception&) {}
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    committed_ = true;
    throw DbError(TranslateCode(e), std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  committed_ = true;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    throw DbError(TranslateCode(e), std::string("postgres rollback: ") + e.what());
  }
}

}
