#include "access_server.hpp"

#include "grpc_error.hpp"

namespace lotgate::grpc {

using namespace lotgate::v1;

AccessServer::AccessServer(std::shared_ptr<lotgate::service::AccessService> svc) : service_(std::move(svc)) {
}

::grpc::Status AccessServer::SubmitDetection(::grpc::ServerContext*, const SubmitDetectionRequest* req,
                                             SubmitDetectionResponse* resp) {
  return Guarded([&] { *resp = service_->SubmitDetection(*req); });
}

::grpc::Status AccessServer::GetSession(::grpc::ServerContext*, const GetSessionRequest* req, GetSessionResponse* resp) {
  return Guarded([&] { *resp = service_->GetSession(*req); });
}

::grpc::Status AccessServer::FindOpenSession(::grpc::ServerContext*, const FindOpenSessionRequest* req,
                                             GetSessionResponse* resp) {
  return Guarded([&] { *resp = service_->FindOpenSession(*req); });
}

::grpc::Status AccessServer::PayAtStation(::grpc::ServerContext*, const PayAtStationRequest* req, GetSessionResponse* resp) {
  return Guarded([&] { *resp = service_->PayAtStation(*req); });
}

} // namespace lotgate::grpc
