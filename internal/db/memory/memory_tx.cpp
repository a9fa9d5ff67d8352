#include "memory_tx.hpp"

namespace lotgate::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.writer_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  RollbackOnDestroy("memory");
}

void MemoryTransaction::ApplyWrites() {
  {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  writer_.unlock();
}

void MemoryTransaction::DiscardWrites() {
  working_ = {};
  writer_.unlock();
}

} // namespace lotgate::db::memory
