#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace lotgate::db::sqlite {

// BEGIN IMMEDIATE under the process-wide writer mutex, so a decision and
// its session write never interleave with another lane's.
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

private:
  void ApplyWrites() override;
  void DiscardWrites() override;

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_;
};

} // namespace lotgate::db::sqlite
