#pragma once

#include "sqlite_db.hpp"

namespace lotgate::db::sqlite {

// Creates tables and indexes if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace lotgate::db::sqlite
