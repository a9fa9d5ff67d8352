#pragma once

#include <google/protobuf/empty.pb.h>

#include <memory>
#include <string>

#include "lotgate/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace lotgate::barrier { class BarrierController; }

namespace lotgate::service {

/*
  Operator surface: barrier recovery, manual session resolution,
  authorization maintenance and the access log.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  lotgate::v1::BarrierResponse GetBarrier(const lotgate::v1::BarrierRequest& req);
  lotgate::v1::BarrierResponse ResetBarrier(const lotgate::v1::BarrierRequest& req);
  lotgate::v1::BarrierResponse OpenBarrier(const lotgate::v1::BarrierRequest& req);

  lotgate::v1::SessionResponse SettleSession(const lotgate::v1::SettleSessionRequest& req);
  lotgate::v1::SessionResponse CancelSession(const lotgate::v1::CancelSessionRequest& req);
  lotgate::v1::SessionResponse ReleaseVehicle(const lotgate::v1::ReleaseVehicleRequest& req);

  void UpsertAuthorization(const lotgate::v1::UpsertAuthorizationRequest& req);
  void DeleteAuthorization(const lotgate::v1::DeleteAuthorizationRequest& req);

  lotgate::v1::ListAuthorizationsResponse ListAuthorizations(const google::protobuf::Empty& req);
  lotgate::v1::ListAccessLogResponse      ListAccessLog(const lotgate::v1::ListAccessLogRequest& req);

 private:
  std::shared_ptr<lotgate::barrier::BarrierController> Barrier(const std::string& barrier_id) const;

  ServiceContext ctx_;
};

} // namespace lotgate::service
