#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace lotgate::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertAuthorization(Transaction&, const model::AuthorizationRecord&) override;
  std::optional<model::AuthorizationRecord> GetAuthorization(Transaction&, const std::string&) override;
  std::vector<model::AuthorizationRecord> ListAuthorizations(Transaction&) override;
  Result DeleteAuthorization(Transaction&, const std::string&) override;

  Result InsertSession(Transaction&, const model::SessionRecord&) override;
  Result UpdateSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  std::optional<model::SessionRecord> FindActiveSession(Transaction&, const std::string&) override;
  std::optional<model::SessionRecord> FindLatestSession(Transaction&, const std::string&) override;
  std::optional<model::SessionRecord> FindSessionByTransaction(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord> ListSessionsByStatus(Transaction&, lotgate::v1::SessionStatus) override;

  Result InsertAccessLog(Transaction&, model::AccessLogRecord&) override;
  std::vector<model::AccessLogRecord> ListAccessLog(Transaction&, const std::string&, uint32_t) override;

  Result UpsertPayment(Transaction&, const model::PaymentRecord&) override;
  std::optional<model::PaymentRecord> GetPayment(Transaction&, const std::string&) override;
  std::vector<model::PaymentRecord> ListPayments(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::AuthorizationRecord>     authorizations;
    std::unordered_map<std::string, model::SessionRecord> sessions;
    std::unordered_map<std::string, std::string>          open_session_by_plate;
    std::vector<model::AccessLogRecord>                   access_log;
    std::unordered_map<std::string, model::PaymentRecord> payments;
    uint64_t                                              next_access_log_id = 1;
  };

  // Held by the open transaction for its whole lifetime.
  std::mutex writer_mutex_;

  std::mutex mutex_;
  State      committed_;
};

}
