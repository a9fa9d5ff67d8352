#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "lotgate/v1.hpp"

namespace lotgate::db::sqlite {

using lotgate::db::ErrorCode;
using lotgate::db::Result;

namespace {

// Owns one prepared statement for the duration of a call.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }

private:
    sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

constexpr const char* kSessionColumns =
    "id,plate,entry_time_ms,exit_time_ms,status,fee_minor,currency,payment_method,"
    "camera_entry_id,camera_exit_id,transaction_id,payment_requested_at_ms,payment_time_ms,"
    "fee_policy,visitor,notes";

model::SessionRecord ReadSession(sqlite3_stmt* st) {
    model::SessionRecord r;
    r.id            = ColText(st, 0);
    r.plate         = ColText(st, 1);
    r.entry_time_ms = ColU64(st, 2);
    r.exit_time_ms  = ColU64(st, 3);
    r.status        = static_cast<lotgate::v1::SessionStatus>(ColI32(st, 4));
    if (sqlite3_column_type(st, 5) != SQLITE_NULL) {
        r.fee_minor = static_cast<int64_t>(sqlite3_column_int64(st, 5));
    }
    r.currency                = ColText(st, 6);
    r.payment_method          = ColText(st, 7);
    r.camera_entry_id         = ColText(st, 8);
    r.camera_exit_id          = ColText(st, 9);
    r.transaction_id          = ColText(st, 10);
    r.payment_requested_at_ms = ColU64(st, 11);
    r.payment_time_ms         = ColU64(st, 12);
    r.fee_policy              = ColText(st, 13);
    r.visitor                 = ColI32(st, 14) != 0;
    r.notes                   = ColText(st, 15);
    return r;
}

// Binds every session column except id, starting at `idx`.
int BindSessionFields(sqlite3_stmt* st, int idx, const model::SessionRecord& r) {
    BindText(st, idx++, r.plate);
    BindU64(st, idx++, r.entry_time_ms);
    BindU64(st, idx++, r.exit_time_ms);
    BindI32(st, idx++, static_cast<int>(r.status));
    if (r.fee_minor) {
        BindI64(st, idx++, *r.fee_minor);
    } else {
        sqlite3_bind_null(st, idx++);
    }
    BindText(st, idx++, r.currency);
    BindText(st, idx++, r.payment_method);
    BindText(st, idx++, r.camera_entry_id);
    BindText(st, idx++, r.camera_exit_id);
    BindText(st, idx++, r.transaction_id);
    BindU64(st, idx++, r.payment_requested_at_ms);
    BindU64(st, idx++, r.payment_time_ms);
    BindText(st, idx++, r.fee_policy);
    BindI32(st, idx++, r.visitor ? 1 : 0);
    BindText(st, idx++, r.notes);
    return idx;
}

std::optional<model::SessionRecord> QueryOneSession(sqlite3* db, const std::string& sql, const std::string& arg) {
    Statement stmt(db, sql.c_str());
    BindText(stmt.get(), 1, arg);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return std::nullopt;
    return ReadSession(stmt.get());
}

model::AuthorizationRecord ReadAuthorization(sqlite3_stmt* st) {
    model::AuthorizationRecord r;
    r.plate          = ColText(st, 0);
    r.owner          = ColText(st, 1);
    r.vehicle_type   = ColText(st, 2);
    r.authorized     = ColI32(st, 3) != 0;
    r.valid_from_ms  = ColU64(st, 4);
    r.valid_until_ms = ColU64(st, 5);
    r.updated_at_ms  = ColU64(st, 6);
    return r;
}

model::AccessLogRecord ReadAccessLog(sqlite3_stmt* st) {
    model::AccessLogRecord r;
    r.id           = ColU64(st, 0);
    r.plate        = ColText(st, 1);
    r.camera_id    = ColText(st, 2);
    r.timestamp_ms = ColU64(st, 3);
    r.direction    = static_cast<lotgate::v1::Direction>(ColI32(st, 4));
    r.granted      = ColI32(st, 5) != 0;
    r.reason       = static_cast<lotgate::v1::DecisionReason>(ColI32(st, 6));
    r.confidence   = sqlite3_column_double(st, 7);
    r.image_ref    = ColText(st, 8);
    r.session_id   = ColText(st, 9);
    return r;
}

model::PaymentRecord ReadPayment(sqlite3_stmt* st) {
    model::PaymentRecord r;
    r.transaction_id = ColText(st, 0);
    r.session_id     = ColText(st, 1);
    r.amount_minor   = static_cast<int64_t>(sqlite3_column_int64(st, 2));
    r.currency       = ColText(st, 3);
    r.state          = static_cast<lotgate::v1::TransactionState>(ColI32(st, 4));
    r.payment_method = ColText(st, 5);
    r.message        = ColText(st, 6);
    r.updated_at_ms  = ColU64(st, 7);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Authorizations
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAuthorization(Transaction& t, const model::AuthorizationRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO authorizations(plate,owner,vehicle_type,authorized,valid_from_ms,valid_until_ms,updated_at_ms) "
        "VALUES(?,?,?,?,?,?,?) "
        "ON CONFLICT(plate) DO UPDATE SET owner=excluded.owner, vehicle_type=excluded.vehicle_type, "
        "authorized=excluded.authorized, valid_from_ms=excluded.valid_from_ms, "
        "valid_until_ms=excluded.valid_until_ms, updated_at_ms=excluded.updated_at_ms;";

    Statement stmt(db, sql);
    BindText(stmt.get(), 1, r.plate);
    BindText(stmt.get(), 2, r.owner);
    BindText(stmt.get(), 3, r.vehicle_type);
    BindI32(stmt.get(), 4, r.authorized ? 1 : 0);
    BindU64(stmt.get(), 5, r.valid_from_ms);
    BindU64(stmt.get(), 6, r.valid_until_ms);
    BindU64(stmt.get(), 7, r.updated_at_ms);

    return Translate(db, sqlite3_step(stmt.get()));
}

std::optional<model::AuthorizationRecord>
SqliteRepository::GetAuthorization(Transaction& t, const std::string& plate) {
    auto* db = TX(t).Handle();

    Statement stmt(db,
        "SELECT plate,owner,vehicle_type,authorized,valid_from_ms,valid_until_ms,updated_at_ms "
        "FROM authorizations WHERE plate=?;");
    BindText(stmt.get(), 1, plate);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return std::nullopt;
    return ReadAuthorization(stmt.get());
}

std::vector<model::AuthorizationRecord> SqliteRepository::ListAuthorizations(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement stmt(db,
        "SELECT plate,owner,vehicle_type,authorized,valid_from_ms,valid_until_ms,updated_at_ms "
        "FROM authorizations ORDER BY plate;");

    std::vector<model::AuthorizationRecord> out;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        out.push_back(ReadAuthorization(stmt.get()));
    }
    return out;
}

Result SqliteRepository::DeleteAuthorization(Transaction& t, const std::string& plate) {
    auto* db = TX(t).Handle();

    Statement stmt(db, "DELETE FROM authorizations WHERE plate=?;");
    BindText(stmt.get(), 1, plate);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "no authorization for " + plate);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO parking_sessions(") + kSessionColumns +
                            ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    Statement stmt(db, sql.c_str());
    BindText(stmt.get(), 1, r.id);
    BindSessionFields(stmt.get(), 2, r);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY) return Result::Err(ErrorCode::AlreadyExists, "session " + r.id);
    return Translate(db, rc);
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE parking_sessions SET plate=?,entry_time_ms=?,exit_time_ms=?,status=?,fee_minor=?,currency=?,"
        "payment_method=?,camera_entry_id=?,camera_exit_id=?,transaction_id=?,payment_requested_at_ms=?,"
        "payment_time_ms=?,fee_policy=?,visitor=?,notes=? WHERE id=?;";

    Statement stmt(db, sql);
    int idx = BindSessionFields(stmt.get(), 1, r);
    BindText(stmt.get(), idx, r.id);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "session " + r.id);
    return Result::Ok();
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& id) {
    return QueryOneSession(TX(t).Handle(),
                           std::string("SELECT ") + kSessionColumns + " FROM parking_sessions WHERE id=?;", id);
}

std::optional<model::SessionRecord> SqliteRepository::FindActiveSession(Transaction& t, const std::string& plate) {
    return QueryOneSession(TX(t).Handle(),
                           std::string("SELECT ") + kSessionColumns +
                               " FROM parking_sessions WHERE plate=? AND status IN (1, 2);",
                           plate);
}

std::optional<model::SessionRecord> SqliteRepository::FindLatestSession(Transaction& t, const std::string& plate) {
    return QueryOneSession(TX(t).Handle(),
                           std::string("SELECT ") + kSessionColumns +
                               " FROM parking_sessions WHERE plate=? ORDER BY entry_time_ms DESC LIMIT 1;",
                           plate);
}

std::optional<model::SessionRecord>
SqliteRepository::FindSessionByTransaction(Transaction& t, const std::string& transaction_id) {
    if (transaction_id.empty()) return std::nullopt;
    return QueryOneSession(TX(t).Handle(),
                           std::string("SELECT ") + kSessionColumns +
                               " FROM parking_sessions WHERE transaction_id=? LIMIT 1;",
                           transaction_id);
}

std::vector<model::SessionRecord>
SqliteRepository::ListSessionsByStatus(Transaction& t, lotgate::v1::SessionStatus status) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kSessionColumns +
                            " FROM parking_sessions WHERE status=? ORDER BY entry_time_ms;";
    Statement stmt(db, sql.c_str());
    BindI32(stmt.get(), 1, static_cast<int>(status));

    std::vector<model::SessionRecord> out;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        out.push_back(ReadSession(stmt.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Access log
// ------------------------------------------------------------------

Result SqliteRepository::InsertAccessLog(Transaction& t, model::AccessLogRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO access_log(plate,camera_id,timestamp_ms,direction,granted,reason,confidence,image_ref,session_id) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    Statement stmt(db, sql);
    BindText(stmt.get(), 1, r.plate);
    BindText(stmt.get(), 2, r.camera_id);
    BindU64(stmt.get(), 3, r.timestamp_ms);
    BindI32(stmt.get(), 4, static_cast<int>(r.direction));
    BindI32(stmt.get(), 5, r.granted ? 1 : 0);
    BindI32(stmt.get(), 6, static_cast<int>(r.reason));
    sqlite3_bind_double(stmt.get(), 7, r.confidence);
    BindText(stmt.get(), 8, r.image_ref);
    BindText(stmt.get(), 9, r.session_id);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::AccessLogRecord>
SqliteRepository::ListAccessLog(Transaction& t, const std::string& plate, uint32_t limit) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,plate,camera_id,timestamp_ms,direction,granted,reason,confidence,image_ref,session_id "
        "FROM access_log WHERE (?1 = '' OR plate = ?1) ORDER BY id DESC LIMIT ?2;";

    Statement stmt(db, sql);
    BindText(stmt.get(), 1, plate);
    BindI64(stmt.get(), 2, limit == 0 ? -1 : static_cast<int64_t>(limit));

    std::vector<model::AccessLogRecord> out;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        out.push_back(ReadAccessLog(stmt.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPayment(Transaction& t, const model::PaymentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO payment_transactions(transaction_id,session_id,amount_minor,currency,state,payment_method,message,updated_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?) "
        "ON CONFLICT(transaction_id) DO UPDATE SET session_id=excluded.session_id, amount_minor=excluded.amount_minor, "
        "currency=excluded.currency, state=excluded.state, payment_method=excluded.payment_method, "
        "message=excluded.message, updated_at_ms=excluded.updated_at_ms;";

    Statement stmt(db, sql);
    BindText(stmt.get(), 1, r.transaction_id);
    BindText(stmt.get(), 2, r.session_id);
    BindI64(stmt.get(), 3, r.amount_minor);
    BindText(stmt.get(), 4, r.currency);
    BindI32(stmt.get(), 5, static_cast<int>(r.state));
    BindText(stmt.get(), 6, r.payment_method);
    BindText(stmt.get(), 7, r.message);
    BindU64(stmt.get(), 8, r.updated_at_ms);

    return Translate(db, sqlite3_step(stmt.get()));
}

std::optional<model::PaymentRecord>
SqliteRepository::GetPayment(Transaction& t, const std::string& transaction_id) {
    auto* db = TX(t).Handle();

    Statement stmt(db,
        "SELECT transaction_id,session_id,amount_minor,currency,state,payment_method,message,updated_at_ms "
        "FROM payment_transactions WHERE transaction_id=?;");
    BindText(stmt.get(), 1, transaction_id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return std::nullopt;
    return ReadPayment(stmt.get());
}

std::vector<model::PaymentRecord>
SqliteRepository::ListPayments(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    Statement stmt(db,
        "SELECT transaction_id,session_id,amount_minor,currency,state,payment_method,message,updated_at_ms "
        "FROM payment_transactions WHERE session_id=? ORDER BY updated_at_ms;");
    BindText(stmt.get(), 1, session_id);

    std::vector<model::PaymentRecord> out;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        out.push_back(ReadPayment(stmt.get()));
    }
    return out;
}

} // namespace lotgate::db::sqlite
