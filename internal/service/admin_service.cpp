#include "admin_service.hpp"

#include "internal/barrier/barrier_router.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/convert.hpp"
#include "internal/model/plate.hpp"
#include "internal/parking/session_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace lotgate::service {

using namespace lotgate::v1;
using lotgate::observability::StringField;

namespace {

BarrierResponse Describe(const barrier::BarrierController& controller) {
  BarrierResponse resp;
  resp.set_barrier_id(controller.Id());
  resp.set_state(controller.State());
  return resp;
}

SessionResponse Wrap(const db::model::SessionRecord& session) {
  SessionResponse resp;
  *resp.mutable_session() = model::ToProto(session);
  return resp;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::shared_ptr<barrier::BarrierController> AdminService::Barrier(const std::string& barrier_id) const {
  auto controller = ctx_.barriers->Get(barrier_id);
  if (!controller) {
    throw util::NotFound("barrier " + barrier_id);
  }
  return controller;
}

// ------------------------------------------------------------------
// Barriers
// ------------------------------------------------------------------

BarrierResponse AdminService::GetBarrier(const BarrierRequest& req) {
  return ObserveRpc("AdminService.GetBarrier", [&] { return Describe(*Barrier(req.barrier_id())); });
}

BarrierResponse AdminService::ResetBarrier(const BarrierRequest& req) {
  return ObserveRpc("AdminService.ResetBarrier", [&] {
    auto controller = Barrier(req.barrier_id());
    controller->Reset();
    LOTGATE_LOG_WARN("barrier reset by operator", {StringField("barrier", controller->Id())});
    return Describe(*controller);
  });
}

BarrierResponse AdminService::OpenBarrier(const BarrierRequest& req) {
  return ObserveRpc("AdminService.OpenBarrier", [&] {
    auto controller = Barrier(req.barrier_id());
    if (!controller->RequestOpen()) {
      throw util::BarrierFault("barrier " + controller->Id() + " is faulted; reset it first");
    }
    LOTGATE_LOG_WARN("barrier opened by operator", {StringField("barrier", controller->Id())});
    return Describe(*controller);
  });
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

SessionResponse AdminService::SettleSession(const SettleSessionRequest& req) {
  return ObserveRpc("AdminService.SettleSession", [&] {
    std::optional<util::Money> amount;
    if (req.has_amount()) {
      amount = util::FromProto(req.amount());
    }
    return Wrap(ctx_.sessions->SettleManually(req.session_id(), amount, req.method()));
  });
}

SessionResponse AdminService::CancelSession(const CancelSessionRequest& req) {
  return ObserveRpc("AdminService.CancelSession",
                    [&] { return Wrap(ctx_.sessions->CancelSession(req.session_id(), req.note())); });
}

SessionResponse AdminService::ReleaseVehicle(const ReleaseVehicleRequest& req) {
  return ObserveRpc("AdminService.ReleaseVehicle",
                    [&] { return Wrap(ctx_.sessions->ReleaseVehicle(req.session_id(), req.barrier_id())); });
}

// ------------------------------------------------------------------
// Authorizations and access log
// ------------------------------------------------------------------

void AdminService::UpsertAuthorization(const UpsertAuthorizationRequest& req) {
  ObserveRpc("AdminService.UpsertAuthorization", [&] {
    auto record = model::FromProto(req.record());
    if (record.plate.empty()) {
      throw util::InvalidState("authorization needs a plate");
    }
    if (record.valid_from_ms != 0 && record.valid_until_ms != 0 && record.valid_until_ms < record.valid_from_ms) {
      throw util::InvalidState("valid_until precedes valid_from");
    }
    record.updated_at_ms = util::ToUnixMillis(util::Now());

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpsertAuthorization(*tx, record), "upsert authorization " + record.plate);
    tx->Commit();
    LOTGATE_LOG_INFO("authorization saved",
                     {StringField("plate", record.plate), lotgate::observability::BoolField("authorized", record.authorized)});
  });
}

void AdminService::DeleteAuthorization(const DeleteAuthorizationRequest& req) {
  ObserveRpc("AdminService.DeleteAuthorization", [&] {
    const auto plate = model::NormalizePlate(req.plate());
    auto       tx    = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->DeleteAuthorization(*tx, plate), "delete authorization " + plate);
    tx->Commit();
    LOTGATE_LOG_INFO("authorization deleted", {StringField("plate", plate)});
  });
}

ListAuthorizationsResponse AdminService::ListAuthorizations(const google::protobuf::Empty&) {
  return ObserveRpc("AdminService.ListAuthorizations", [&] {
    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListAuthorizations(*tx);
    tx->Commit();

    ListAuthorizationsResponse resp;
    for (const auto& record : records) {
      *resp.add_records() = model::ToProto(record);
    }
    return resp;
  });
}

ListAccessLogResponse AdminService::ListAccessLog(const ListAccessLogRequest& req) {
  return ObserveRpc("AdminService.ListAccessLog", [&] {
    auto tx      = ctx_.repository->Begin();
    auto entries = ctx_.repository->ListAccessLog(*tx, model::NormalizePlate(req.plate()), req.limit());
    tx->Commit();

    ListAccessLogResponse resp;
    for (const auto& entry : entries) {
      *resp.add_entries() = model::ToProto(entry);
    }
    return resp;
  });
}

} // namespace lotgate::service
