#include "sqlite_tx.hpp"

namespace lotgate::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->WriterMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  RollbackOnDestroy("sqlite");
}

void SqliteTransaction::ApplyWrites() {
  db_->Exec("COMMIT;");
  writer_.unlock();
}

void SqliteTransaction::DiscardWrites() {
  // release the writer even when ROLLBACK reports an error
  std::unique_lock<std::mutex> writer = std::move(writer_);
  db_->Exec("ROLLBACK;");
}

} // namespace lotgate::db::sqlite
