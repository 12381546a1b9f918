#include "memory_tx.hpp"

namespace relcache::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_lock_(repo.writer_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace relcache::db::memory
