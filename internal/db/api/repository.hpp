#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/access_log_record.hpp"
#include "internal/db/model/authorization_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/session_record.hpp"

namespace lotgate::db {

/*
  Persistent state of the car park: who may enter, who is parked, what the
  cameras saw and what the payment terminal reported.

  Every call runs inside a Transaction from Begin() and sees that
  transaction's own writes. A plate has at most one open session
  (ACTIVE or PENDING_PAYMENT); an insert or update that would give it a
  second one returns ConstraintViolation and changes nothing.
*/
class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Authorizations (plate is the key, already normalized)
  // ---------------------------------------------------------------------

  virtual Result UpsertAuthorization(Transaction&, const model::AuthorizationRecord&) = 0;

  virtual std::optional<model::AuthorizationRecord> GetAuthorization(Transaction&, const std::string& plate) = 0;

  virtual std::vector<model::AuthorizationRecord> ListAuthorizations(Transaction&) = 0;

  virtual Result DeleteAuthorization(Transaction&, const std::string& plate) = 0;

  // ---------------------------------------------------------------------
  // Parking sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual Result UpdateSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& id) = 0;

  // The plate's open (ACTIVE or PENDING_PAYMENT) session, if any.
  virtual std::optional<model::SessionRecord> FindActiveSession(Transaction&, const std::string& plate) = 0;

  // Most recently entered session of any status.
  virtual std::optional<model::SessionRecord> FindLatestSession(Transaction&, const std::string& plate) = 0;

  virtual std::optional<model::SessionRecord> FindSessionByTransaction(Transaction&, const std::string& transaction_id) = 0;

  virtual std::vector<model::SessionRecord> ListSessionsByStatus(Transaction&, lotgate::v1::SessionStatus status) = 0;

  // ---------------------------------------------------------------------
  // Access log
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertAccessLog(Transaction&, model::AccessLogRecord&) = 0;

  // Newest first. Empty plate lists every plate.
  virtual std::vector<model::AccessLogRecord> ListAccessLog(Transaction&, const std::string& plate, uint32_t limit) = 0;

  // ---------------------------------------------------------------------
  // Payment audit trail
  // ---------------------------------------------------------------------

  virtual Result UpsertPayment(Transaction&, const model::PaymentRecord&) = 0;

  virtual std::optional<model::PaymentRecord> GetPayment(Transaction&, const std::string& transaction_id) = 0;

  virtual std::vector<model::PaymentRecord> ListPayments(Transaction&, const std::string& session_id) = 0;
};

} // namespace lotgate::db
