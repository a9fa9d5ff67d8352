#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace lotgate::access {

using db::model::AuthorizationRecord;

/*
  Plate -> authorization lookup. Read-only to the decision path.
  Plates passed in are already normalized.
*/
class AuthorizationStore {
 public:
  virtual ~AuthorizationStore() = default;

  virtual std::optional<AuthorizationRecord> Lookup(const std::string& plate) = 0;
};

// Authorized flag set and `at` inside [valid_from, valid_until].
bool IsAuthorized(const std::optional<AuthorizationRecord>& record, util::TimePoint at);

class RepositoryAuthorizationStore final : public AuthorizationStore {
 public:
  explicit RepositoryAuthorizationStore(std::shared_ptr<db::Repository> repository);

  std::optional<AuthorizationRecord> Lookup(const std::string& plate) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace lotgate::access
