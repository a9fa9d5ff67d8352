#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/access_service.hpp"
#include "lotgate/v1/access_service.grpc.pb.h"

namespace lotgate::grpc {

class AccessServer final : public lotgate::v1::AccessService::Service {
 public:
  explicit AccessServer(std::shared_ptr<lotgate::service::AccessService> svc);

  ::grpc::Status SubmitDetection(::grpc::ServerContext*, const lotgate::v1::SubmitDetectionRequest*,
                                 lotgate::v1::SubmitDetectionResponse*) override;
  ::grpc::Status GetSession(::grpc::ServerContext*, const lotgate::v1::GetSessionRequest*,
                            lotgate::v1::GetSessionResponse*) override;
  ::grpc::Status FindOpenSession(::grpc::ServerContext*, const lotgate::v1::FindOpenSessionRequest*,
                                 lotgate::v1::GetSessionResponse*) override;
  ::grpc::Status PayAtStation(::grpc::ServerContext*, const lotgate::v1::PayAtStationRequest*,
                              lotgate::v1::GetSessionResponse*) override;

 private:
  std::shared_ptr<lotgate::service::AccessService> service_;
};

} // namespace lotgate::grpc
