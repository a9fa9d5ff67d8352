#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace lotgate::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3*, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
