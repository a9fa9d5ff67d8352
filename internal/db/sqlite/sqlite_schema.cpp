#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace lotgate::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS authorizations (plate TEXT PRIMARY KEY, owner TEXT, vehicle_type TEXT, authorized INTEGER NOT NULL, valid_from_ms INTEGER NOT NULL DEFAULT 0, valid_until_ms INTEGER NOT NULL DEFAULT 0, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS parking_sessions (id TEXT PRIMARY KEY, plate TEXT NOT NULL, entry_time_ms INTEGER NOT NULL, exit_time_ms INTEGER NOT NULL DEFAULT 0, status INTEGER NOT NULL, fee_minor INTEGER, currency TEXT, payment_method TEXT, camera_entry_id TEXT, camera_exit_id TEXT, transaction_id TEXT, payment_requested_at_ms INTEGER NOT NULL DEFAULT 0, payment_time_ms INTEGER NOT NULL DEFAULT 0, fee_policy TEXT, visitor INTEGER NOT NULL DEFAULT 0, notes TEXT);",
      // one open (ACTIVE / PENDING_PAYMENT) session per plate
      "CREATE UNIQUE INDEX IF NOT EXISTS parking_sessions_open_plate ON parking_sessions(plate) WHERE status IN (1, 2);",
      "CREATE INDEX IF NOT EXISTS parking_sessions_plate_entry ON parking_sessions(plate, entry_time_ms);",
      "CREATE INDEX IF NOT EXISTS parking_sessions_transaction ON parking_sessions(transaction_id);",
      "CREATE TABLE IF NOT EXISTS access_log (id INTEGER PRIMARY KEY AUTOINCREMENT, plate TEXT NOT NULL, camera_id TEXT NOT NULL, timestamp_ms INTEGER NOT NULL, direction INTEGER NOT NULL, granted INTEGER NOT NULL, reason INTEGER NOT NULL, confidence REAL NOT NULL, image_ref TEXT, session_id TEXT);",
      "CREATE INDEX IF NOT EXISTS access_log_plate ON access_log(plate, id);",
      "CREATE TABLE IF NOT EXISTS payment_transactions (transaction_id TEXT PRIMARY KEY, session_id TEXT NOT NULL, amount_minor INTEGER NOT NULL, currency TEXT, state INTEGER NOT NULL, payment_method TEXT, message TEXT, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS lotgate_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO lotgate_schema_migrations(version, applied_at_ms) VALUES(1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace lotgate::db::sqlite
