#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if LOTGATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using lotgate::db::ErrorCode;
using lotgate::db::Repository;
using lotgate::db::memory::MemoryRepository;
using lotgate::db::model::AccessLogRecord;
using lotgate::db::model::AuthorizationRecord;
using lotgate::db::model::PaymentRecord;
using lotgate::db::model::SessionRecord;
using namespace lotgate::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                   name;
  std::function<std::shared_ptr<Repository>()>  make_repository;
  std::function<void()>                         cleanup;
};

SessionRecord MakeSession(const std::string& id, const std::string& plate, uint64_t entry_ms,
                          SessionStatus status = SESSION_STATUS_ACTIVE) {
  SessionRecord session;
  session.id              = id;
  session.plate           = plate;
  session.entry_time_ms   = entry_ms;
  session.status          = status;
  session.currency        = "USD";
  session.camera_entry_id = "cam-entry";
  session.fee_policy      = R"({"mode":"FEE_MODE_HOURLY","hourlyRate":2})";
  session.visitor         = true;
  return session;
}

void VerifyAuthorizations(Repository& repo) {
  auto tx = repo.Begin();

  AuthorizationRecord resident;
  resident.plate          = "RES001";
  resident.owner          = "unit 4";
  resident.vehicle_type   = "car";
  resident.valid_until_ms = 2000000000000ULL;
  resident.updated_at_ms  = NowMs();
  assert(repo.UpsertAuthorization(*tx, resident));

  AuthorizationRecord banned;
  banned.plate      = "BAN001";
  banned.authorized = false;
  assert(repo.UpsertAuthorization(*tx, banned));

  auto read = repo.GetAuthorization(*tx, "RES001");
  assert(read.has_value());
  assert(read->owner == "unit 4");
  assert(read->authorized);
  assert(read->valid_from_ms == 0);
  assert(read->valid_until_ms == 2000000000000ULL);

  resident.owner = "unit 5";
  assert(repo.UpsertAuthorization(*tx, resident));
  assert(repo.GetAuthorization(*tx, "RES001")->owner == "unit 5");

  const auto all = repo.ListAuthorizations(*tx);
  assert(all.size() == 2);
  assert(all[0].plate == "BAN001");
  assert(!all[0].authorized);

  assert(repo.DeleteAuthorization(*tx, "BAN001"));
  assert(!repo.GetAuthorization(*tx, "BAN001").has_value());
  assert(repo.DeleteAuthorization(*tx, "BAN001").code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifySessionLifecycle(Repository& repo) {
  auto tx = repo.Begin();

  auto first = MakeSession("s-1", "AB123", 1000);
  assert(repo.InsertSession(*tx, first));
  assert(repo.InsertSession(*tx, first).code == ErrorCode::AlreadyExists);

  auto active = repo.FindActiveSession(*tx, "AB123");
  assert(active.has_value());
  assert(active->id == "s-1");
  assert(!active->fee_minor.has_value());
  assert(active->visitor);
  assert(active->fee_policy == first.fee_policy);

  first.status                  = SESSION_STATUS_PENDING_PAYMENT;
  first.fee_minor               = 400;
  first.transaction_id          = "tx-1";
  first.payment_requested_at_ms = 5000;
  assert(repo.UpdateSession(*tx, first));

  auto by_tx = repo.FindSessionByTransaction(*tx, "tx-1");
  assert(by_tx.has_value());
  assert(by_tx->id == "s-1");
  assert(by_tx->fee_minor.value() == 400);
  assert(!repo.FindSessionByTransaction(*tx, "tx-unknown").has_value());

  // still open while payment is pending
  assert(repo.FindActiveSession(*tx, "AB123")->status == SESSION_STATUS_PENDING_PAYMENT);

  first.status          = SESSION_STATUS_PAID;
  first.exit_time_ms    = 6000;
  first.payment_time_ms = 6000;
  first.payment_method  = "card";
  assert(repo.UpdateSession(*tx, first));
  assert(!repo.FindActiveSession(*tx, "AB123").has_value());

  auto second = MakeSession("s-2", "AB123", 9000);
  assert(repo.InsertSession(*tx, second));

  auto latest = repo.FindLatestSession(*tx, "AB123");
  assert(latest.has_value());
  assert(latest->id == "s-2");

  auto missing = MakeSession("s-missing", "ZZ999", 1);
  assert(repo.UpdateSession(*tx, missing).code == ErrorCode::NotFound);
  assert(!repo.GetSession(*tx, "s-missing").has_value());

  tx->Commit();

  auto read_tx = repo.Begin();
  auto paid    = repo.ListSessionsByStatus(*read_tx, SESSION_STATUS_PAID);
  assert(paid.size() == 1);
  assert(paid[0].exit_time_ms == 6000);
  assert(paid[0].payment_method == "card");
  assert(repo.ListSessionsByStatus(*read_tx, SESSION_STATUS_ACTIVE).size() == 1);
  read_tx->Commit();
}

void VerifyOneOpenSessionPerPlate(Repository& repo) {
  auto tx = repo.Begin();

  assert(repo.InsertSession(*tx, MakeSession("open-1", "CD456", 1000)));
  assert(repo.InsertSession(*tx, MakeSession("open-2", "CD456", 2000)).code == ErrorCode::ConstraintViolation);

  // closed sessions do not count
  assert(repo.InsertSession(*tx, MakeSession("closed-1", "CD456", 500, SESSION_STATUS_CANCELLED)));

  // reopening the cancelled one would make two open sessions
  auto reopened   = MakeSession("closed-1", "CD456", 500, SESSION_STATUS_ACTIVE);
  assert(repo.UpdateSession(*tx, reopened).code == ErrorCode::ConstraintViolation);

  // other plates are independent
  assert(repo.InsertSession(*tx, MakeSession("open-3", "EF789", 1000)));

  tx->Commit();
}

void VerifyAccessLog(Repository& repo) {
  auto tx = repo.Begin();

  std::vector<uint64_t> ids;
  for (int i = 0; i < 4; ++i) {
    AccessLogRecord entry;
    entry.plate        = i % 2 == 0 ? "AB123" : "XY999";
    entry.camera_id    = "cam-entry";
    entry.timestamp_ms = 1000 + i;
    entry.direction    = DIRECTION_ENTRY;
    entry.granted      = i != 3;
    entry.reason       = i != 3 ? DECISION_REASON_VISITOR : DECISION_REASON_UNAUTHORIZED;
    entry.confidence   = 0.9;
    entry.session_id   = "s-" + std::to_string(i);
    assert(repo.InsertAccessLog(*tx, entry));
    assert(entry.id != 0);
    ids.push_back(entry.id);
  }
  assert(ids[0] < ids[1] && ids[1] < ids[2] && ids[2] < ids[3]);

  const auto all = repo.ListAccessLog(*tx, "", 0);
  assert(all.size() == 4);
  assert(all[0].id == ids[3]);
  assert(!all[0].granted);
  assert(all[0].reason == DECISION_REASON_UNAUTHORIZED);

  const auto plate = repo.ListAccessLog(*tx, "AB123", 0);
  assert(plate.size() == 2);
  assert(plate[0].timestamp_ms == 1002);
  assert(plate[1].session_id == "s-0");

  const auto limited = repo.ListAccessLog(*tx, "", 3);
  assert(limited.size() == 3);
  assert(limited[2].id == ids[1]);

  tx->Commit();
}

void VerifyPayments(Repository& repo) {
  auto tx = repo.Begin();

  PaymentRecord failed;
  failed.transaction_id = "tx-a";
  failed.session_id     = "s-pay";
  failed.amount_minor   = 600;
  failed.currency       = "USD";
  failed.state          = TRANSACTION_STATE_PENDING;
  failed.updated_at_ms  = 1000;
  assert(repo.UpsertPayment(*tx, failed));

  failed.state         = TRANSACTION_STATE_FAILED;
  failed.message       = "card declined";
  failed.updated_at_ms = 2000;
  assert(repo.UpsertPayment(*tx, failed));

  PaymentRecord completed = failed;
  completed.transaction_id = "tx-b";
  completed.state          = TRANSACTION_STATE_COMPLETED;
  completed.payment_method = "card";
  completed.message.clear();
  completed.updated_at_ms = 3000;
  assert(repo.UpsertPayment(*tx, completed));

  auto read = repo.GetPayment(*tx, "tx-a");
  assert(read.has_value());
  assert(read->state == TRANSACTION_STATE_FAILED);
  assert(read->message == "card declined");
  assert(!repo.GetPayment(*tx, "tx-none").has_value());

  const auto history = repo.ListPayments(*tx, "s-pay");
  assert(history.size() == 2);
  assert(history[0].transaction_id == "tx-a");
  assert(history[1].state == TRANSACTION_STATE_COMPLETED);
  assert(repo.ListPayments(*tx, "s-other").empty());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession("rolled-back", "RB001", 1000)));
    AuthorizationRecord record;
    record.plate = "RB001";
    assert(repo.UpsertAuthorization(*tx, record));
    assert(tx->IsOpen());
    tx->Rollback();
    assert(!tx->IsOpen() && !tx->IsCommitted());
    tx->Rollback();

    bool commit_refused = false;
    try {
      tx->Commit();
    } catch (const std::logic_error&) {
      commit_refused = true;
    }
    assert(commit_refused);
  }

  {
    // destructor without commit rolls back too
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession("dropped", "RB002", 1000)));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetSession(*check_tx, "rolled-back").has_value());
  assert(!repo.GetSession(*check_tx, "dropped").has_value());
  assert(!repo.FindActiveSession(*check_tx, "RB001").has_value());
  assert(!repo.GetAuthorization(*check_tx, "RB001").has_value());
  check_tx->Commit();

  // the plate index was rolled back with the row
  auto tx = repo.Begin();
  assert(repo.InsertSession(*tx, MakeSession("retry", "RB001", 2000)));
  tx->Commit();
  assert(tx->IsCommitted());
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name            = "memory",
      .make_repository = []() { return std::make_shared<MemoryRepository>(); },
      .cleanup         = []() {},
  };
}

#if LOTGATE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("lotgate_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  return BackendFactory{
      .name = "sqlite",
      .make_repository =
          [db_path]() {
            auto db = lotgate::db::sqlite::SqliteDB::Open(db_path);
            assert(db->SchemaVersion() == 1);
            return std::make_shared<lotgate::db::sqlite::SqliteRepository>(db);
          },
      .cleanup =
          [db_path]() {
            std::error_code ec;
            std::filesystem::remove(db_path, ec);
            std::filesystem::remove(db_path + "-wal", ec);
            std::filesystem::remove(db_path + "-shm", ec);
          },
  };
}

// Rows survive reopening the database file.
void VerifyRestartDurability(BackendFactory& backend) {
  {
    auto repo = backend.make_repository();
    auto tx   = repo->Begin();
    assert(repo->InsertSession(*tx, MakeSession("durable", "DU001", 1234)));
    tx->Commit();
  }

  auto repo    = backend.make_repository();
  auto tx      = repo->Begin();
  auto session = repo->FindActiveSession(*tx, "DU001");
  assert(session.has_value());
  assert(session->id == "durable");
  assert(session->entry_time_ms == 1234);
  tx->Commit();
}
#endif

void RunBackend(BackendFactory& backend) {
  auto repo = backend.make_repository();

  VerifyAuthorizations(*repo);
  VerifySessionLifecycle(*repo);
  VerifyOneOpenSessionPerPlate(*repo);
  VerifyAccessLog(*repo);
  VerifyPayments(*repo);
  VerifyRollbackBehavior(*repo);

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if LOTGATE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackend(backend);
  }

#if LOTGATE_DB_SQLITE
  VerifyRestartDurability(backends.back());
  backends.back().cleanup();
#endif

  std::cout << "lotgate_integration_repository_parity: pass\n";
  return 0;
}
