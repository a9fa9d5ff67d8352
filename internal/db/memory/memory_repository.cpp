#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/session_state.hpp"
#include "memory_tx.hpp"

namespace lotgate::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Authorizations
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAuthorization(Transaction& t, const model::AuthorizationRecord& r) {
  TX(t).Mutable().authorizations[r.plate] = r;
  return Result::Ok();
}

std::optional<model::AuthorizationRecord> MemoryRepository::GetAuthorization(Transaction& t, const std::string& plate) {
  const auto& s  = TX(t).View();
  auto        it = s.authorizations.find(plate);
  if (it == s.authorizations.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AuthorizationRecord> MemoryRepository::ListAuthorizations(Transaction& t) {
  const auto&                             s = TX(t).View();
  std::vector<model::AuthorizationRecord> records;
  records.reserve(s.authorizations.size());
  for (const auto& [_, record] : s.authorizations) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteAuthorization(Transaction& t, const std::string& plate) {
  auto& s = TX(t).Mutable();
  if (s.authorizations.erase(plate) == 0) return Result::Err(ErrorCode::NotFound, "no authorization for " + plate);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "session " + r.id);
  if (lotgate::model::IsOpen(r.status) && s.open_session_by_plate.contains(r.plate)) {
    return Result::Err(ErrorCode::ConstraintViolation, "plate " + r.plate + " already has an open session");
  }
  s.sessions[r.id] = r;
  if (lotgate::model::IsOpen(r.status)) s.open_session_by_plate[r.plate] = r.id;
  return Result::Ok();
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sessions.find(r.id);
  if (it == s.sessions.end()) return Result::Err(ErrorCode::NotFound, "session " + r.id);

  auto open = s.open_session_by_plate.find(r.plate);
  if (lotgate::model::IsOpen(r.status)) {
    if (open != s.open_session_by_plate.end() && open->second != r.id) {
      return Result::Err(ErrorCode::ConstraintViolation, "plate " + r.plate + " already has an open session");
    }
    s.open_session_by_plate[r.plate] = r.id;
  } else if (open != s.open_session_by_plate.end() && open->second == r.id) {
    s.open_session_by_plate.erase(open);
  }

  it->second = r;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::SessionRecord> MemoryRepository::FindActiveSession(Transaction& t, const std::string& plate) {
  const auto& s    = TX(t).View();
  auto        open = s.open_session_by_plate.find(plate);
  if (open == s.open_session_by_plate.end()) return std::nullopt;
  return s.sessions.at(open->second);
}

std::optional<model::SessionRecord> MemoryRepository::FindLatestSession(Transaction& t, const std::string& plate) {
  const auto&                         s = TX(t).View();
  std::optional<model::SessionRecord> latest;
  for (const auto& [_, record] : s.sessions) {
    if (record.plate != plate) continue;
    if (!latest || record.entry_time_ms > latest->entry_time_ms) latest = record;
  }
  return latest;
}

std::optional<model::SessionRecord> MemoryRepository::FindSessionByTransaction(Transaction& t, const std::string& transaction_id) {
  if (transaction_id.empty()) return std::nullopt;
  const auto& s = TX(t).View();
  for (const auto& [_, record] : s.sessions) {
    if (record.transaction_id == transaction_id) return record;
  }
  return std::nullopt;
}

std::vector<model::SessionRecord> MemoryRepository::ListSessionsByStatus(Transaction& t, lotgate::v1::SessionStatus status) {
  const auto&                       s = TX(t).View();
  std::vector<model::SessionRecord> records;
  for (const auto& [_, record] : s.sessions) {
    if (record.status == status) records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.entry_time_ms < b.entry_time_ms; });
  return records;
}

// ------------------------------------------------------------------
// Access log
// ------------------------------------------------------------------

Result MemoryRepository::InsertAccessLog(Transaction& t, model::AccessLogRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_access_log_id++;
  s.access_log.push_back(r);
  return Result::Ok();
}

std::vector<model::AccessLogRecord> MemoryRepository::ListAccessLog(Transaction& t, const std::string& plate, uint32_t limit) {
  const auto&                         s = TX(t).View();
  std::vector<model::AccessLogRecord> records;
  for (auto it = s.access_log.rbegin(); it != s.access_log.rend(); ++it) {
    if (!plate.empty() && it->plate != plate) continue;
    records.push_back(*it);
    if (limit != 0 && records.size() >= limit) break;
  }
  return records;
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPayment(Transaction& t, const model::PaymentRecord& r) {
  TX(t).Mutable().payments[r.transaction_id] = r;
  return Result::Ok();
}

std::optional<model::PaymentRecord> MemoryRepository::GetPayment(Transaction& t, const std::string& transaction_id) {
  const auto& s  = TX(t).View();
  auto        it = s.payments.find(transaction_id);
  if (it == s.payments.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PaymentRecord> MemoryRepository::ListPayments(Transaction& t, const std::string& session_id) {
  const auto&                       s = TX(t).View();
  std::vector<model::PaymentRecord> records;
  for (const auto& [_, record] : s.payments) {
    if (record.session_id == session_id) records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.updated_at_ms < b.updated_at_ms; });
  return records;
}

} // namespace lotgate::db::memory
