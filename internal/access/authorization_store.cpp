#include "internal/access/authorization_store.hpp"

namespace lotgate::access {

bool IsAuthorized(const std::optional<AuthorizationRecord>& record, util::TimePoint at) {
  if (!record || !record->authorized) {
    return false;
  }
  const auto at_ms = util::ToUnixMillis(at);
  if (record->valid_from_ms != 0 && at_ms < record->valid_from_ms) {
    return false;
  }
  if (record->valid_until_ms != 0 && at_ms > record->valid_until_ms) {
    return false;
  }
  return true;
}

RepositoryAuthorizationStore::RepositoryAuthorizationStore(std::shared_ptr<db::Repository> repository)
    : repository_(std::move(repository)) {
}

std::optional<AuthorizationRecord> RepositoryAuthorizationStore::Lookup(const std::string& plate) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetAuthorization(*tx, plate);
  tx->Commit();
  return record;
}

} // namespace lotgate::access
