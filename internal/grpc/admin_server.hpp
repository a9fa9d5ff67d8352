#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "lotgate/v1/admin_service.grpc.pb.h"

namespace lotgate::grpc {

class AdminServer final : public lotgate::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<lotgate::service::AdminService> svc);

  ::grpc::Status GetBarrier(::grpc::ServerContext*, const lotgate::v1::BarrierRequest*, lotgate::v1::BarrierResponse*) override;
  ::grpc::Status ResetBarrier(::grpc::ServerContext*, const lotgate::v1::BarrierRequest*, lotgate::v1::BarrierResponse*) override;
  ::grpc::Status OpenBarrier(::grpc::ServerContext*, const lotgate::v1::BarrierRequest*, lotgate::v1::BarrierResponse*) override;

  ::grpc::Status SettleSession(::grpc::ServerContext*, const lotgate::v1::SettleSessionRequest*,
                               lotgate::v1::SessionResponse*) override;
  ::grpc::Status CancelSession(::grpc::ServerContext*, const lotgate::v1::CancelSessionRequest*,
                               lotgate::v1::SessionResponse*) override;
  ::grpc::Status ReleaseVehicle(::grpc::ServerContext*, const lotgate::v1::ReleaseVehicleRequest*,
                                lotgate::v1::SessionResponse*) override;

  ::grpc::Status UpsertAuthorization(::grpc::ServerContext*, const lotgate::v1::UpsertAuthorizationRequest*,
                                     google::protobuf::Empty*) override;
  ::grpc::Status DeleteAuthorization(::grpc::ServerContext*, const lotgate::v1::DeleteAuthorizationRequest*,
                                     google::protobuf::Empty*) override;
  ::grpc::Status ListAuthorizations(::grpc::ServerContext*, const google::protobuf::Empty*,
                                    lotgate::v1::ListAuthorizationsResponse*) override;
  ::grpc::Status ListAccessLog(::grpc::ServerContext*, const lotgate::v1::ListAccessLogRequest*,
                               lotgate::v1::ListAccessLogResponse*) override;

 private:
  std::shared_ptr<lotgate::service::AdminService> service_;
};

} // namespace lotgate::grpc
