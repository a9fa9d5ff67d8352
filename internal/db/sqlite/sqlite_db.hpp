#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace lotgate::db::sqlite {

// The lot database file. A single connection serves every transaction;
// writers take WriterMutex() for the whole BEGIN IMMEDIATE .. COMMIT span.
class SqliteDB {
 public:
  // Opens or creates `path`, applies pragmas and the lot schema.
  static std::shared_ptr<SqliteDB> Open(const std::string& path, bool wal_mode = true);

  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3*           Handle() const { return db_; }
  const std::string& Path() const { return path_; }
  std::mutex&        WriterMutex() { return writer_mutex_; }

  void Exec(const std::string& sql);

  // Highest applied schema migration, 0 on an empty file.
  int64_t SchemaVersion();

 private:
  explicit SqliteDB(std::string path);

  void ApplyPragmas(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace lotgate::db::sqlite
