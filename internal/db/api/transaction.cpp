#include "internal/db/api/transaction.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace lotgate::db {

void Transaction::Commit() {
  if (state_ != State::Open) {
    throw std::logic_error(state_ == State::Committed ? "transaction already committed" : "transaction already rolled back");
  }
  ApplyWrites();
  state_ = State::Committed;
}

void Transaction::Rollback() {
  if (state_ != State::Open) return;
  state_ = State::RolledBack;
  DiscardWrites();
}

void Transaction::RollbackOnDestroy(const std::string& backend) noexcept {
  if (state_ != State::Open) return;
  try {
    Rollback();
  } catch (const std::exception& e) {
    LOTGATE_LOG_ERROR("rollback of abandoned transaction failed",
                      {observability::StringField("backend", backend), observability::StringField("error", e.what())});
  }
}

} // namespace lotgate::db
