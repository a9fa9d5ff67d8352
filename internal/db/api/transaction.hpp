#pragma once

#include <string>

namespace lotgate::db {

/*
  One unit of repository work: a decision together with the session it
  opens or closes and its access log row, or a single operator edit.

  Begin() hands out at most one open transaction per repository; other
  writers wait there. Writes stay invisible to other transactions until
  Commit(). A transaction dropped while still open is rolled back.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  Transaction(const Transaction&)            = delete;
  Transaction& operator=(const Transaction&) = delete;

  // Throws std::logic_error once the transaction has finished.
  void Commit();

  // No-op once finished.
  void Rollback();

  bool IsCommitted() const { return state_ == State::Committed; }
  bool IsOpen() const { return state_ == State::Open; }

protected:
  Transaction() = default;

  virtual void ApplyWrites()   = 0;
  virtual void DiscardWrites() = 0;

  // Called from backend destructors. Failures are logged with `backend`.
  void RollbackOnDestroy(const std::string& backend) noexcept;

private:
  enum class State { Open, Committed, RolledBack };

  State state_ = State::Open;
};

} // namespace lotgate::db
