#include "access_service.hpp"

#include "internal/access/decision_engine.hpp"
#include "internal/model/convert.hpp"
#include "internal/parking/session_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace lotgate::service {

using namespace lotgate::v1;

AccessService::AccessService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitDetectionResponse AccessService::SubmitDetection(const SubmitDetectionRequest& req) {
  return ObserveRpc("AccessService.SubmitDetection", [&] {
    const auto& detection = req.detection();
    if (detection.confidence() < 0.0 || detection.confidence() > 1.0) {
      throw util::InvalidState("confidence must be within [0, 1]");
    }

    model::PlateDetectionEvent event;
    event.plate      = detection.plate();
    event.confidence = detection.confidence();
    event.camera_id  = detection.camera_id();
    event.timestamp  = detection.has_timestamp() ? util::FromProto(detection.timestamp()) : util::Now();
    event.image_ref  = detection.image_ref();

    SubmitDetectionResponse resp;
    auto                    decision = ctx_.engine->Process(event);
    resp.set_admitted(decision.has_value());
    if (decision) {
      *resp.mutable_decision() = access::ToProto(*decision);
    }
    return resp;
  });
}

GetSessionResponse AccessService::GetSession(const GetSessionRequest& req) {
  return ObserveRpc("AccessService.GetSession", [&] {
    auto session = ctx_.sessions->GetSession(req.session_id());
    if (!session) {
      throw util::NotFound("session " + req.session_id());
    }

    GetSessionResponse resp;
    *resp.mutable_session() = model::ToProto(*session);
    return resp;
  });
}

GetSessionResponse AccessService::FindOpenSession(const FindOpenSessionRequest& req) {
  return ObserveRpc("AccessService.FindOpenSession", [&] {
    auto session = ctx_.sessions->FindOpenSession(req.plate());
    if (!session) {
      throw util::NotFound("no open session for plate " + req.plate());
    }

    GetSessionResponse resp;
    *resp.mutable_session() = model::ToProto(*session);
    return resp;
  });
}

GetSessionResponse AccessService::PayAtStation(const PayAtStationRequest& req) {
  return ObserveRpc("AccessService.PayAtStation", [&] {
    if (!ctx_.sessions->Options().PayStation()) {
      throw util::InvalidState("payment is collected at the exit barrier");
    }

    GetSessionResponse resp;
    *resp.mutable_session() = model::ToProto(ctx_.sessions->PayAtStation(req.plate()));
    return resp;
  });
}

} // namespace lotgate::service
