#include "sqlite_db.hpp"

#include <stdexcept>

#include "sqlite_schema.hpp"

namespace lotgate::db::sqlite {

namespace {

// Busy handler wait before a writer gives up on a locked file.
constexpr int kBusyTimeoutMs = 5000;

} // namespace

std::shared_ptr<SqliteDB> SqliteDB::Open(const std::string& path, bool wal_mode) {
  std::shared_ptr<SqliteDB> db(new SqliteDB(path));
  db->ApplyPragmas(wal_mode);
  BootstrapSchema(*db);
  return db;
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open lot database " + path_ + ": " + reason);
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  const std::string reason = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw std::runtime_error(path_ + ": " + reason);
}

int64_t SqliteDB::SchemaVersion() {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COALESCE(MAX(version), 0) FROM lotgate_schema_migrations;", -1, &stmt, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return 0;
  }
  const int64_t version = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int64(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  return version;
}

void SqliteDB::ApplyPragmas(bool wal_mode) {
  // ":memory:" databases ignore WAL
  if (wal_mode) Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA temp_store=MEMORY;");

  // lets callers tell a primary-key clash from the open-session index
  sqlite3_extended_result_codes(db_, 1);

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(path_ + ": busy_timeout: " + sqlite3_errmsg(db_));
  }
}

} // namespace lotgate::db::sqlite
