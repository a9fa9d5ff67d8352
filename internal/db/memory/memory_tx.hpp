#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace lotgate::db::memory {

// Works on a private copy of the lot state; Commit() swaps it in whole.
class MemoryTransaction final : public db::Transaction {
public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  MemoryRepository::State&       Mutable() { return working_; }
  const MemoryRepository::State& View() const { return working_; }

private:
  void ApplyWrites() override;
  void DiscardWrites() override;

  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> writer_;
  MemoryRepository::State      working_;
};

} // namespace lotgate::db::memory
