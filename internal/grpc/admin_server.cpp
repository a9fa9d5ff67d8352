#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace lotgate::grpc {

using namespace lotgate::v1;

AdminServer::AdminServer(std::shared_ptr<lotgate::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetBarrier(::grpc::ServerContext*, const BarrierRequest* req, BarrierResponse* resp) {
  return Guarded([&] { *resp = service_->GetBarrier(*req); });
}

::grpc::Status AdminServer::ResetBarrier(::grpc::ServerContext*, const BarrierRequest* req, BarrierResponse* resp) {
  return Guarded([&] { *resp = service_->ResetBarrier(*req); });
}

::grpc::Status AdminServer::OpenBarrier(::grpc::ServerContext*, const BarrierRequest* req, BarrierResponse* resp) {
  return Guarded([&] { *resp = service_->OpenBarrier(*req); });
}

::grpc::Status AdminServer::SettleSession(::grpc::ServerContext*, const SettleSessionRequest* req, SessionResponse* resp) {
  return Guarded([&] { *resp = service_->SettleSession(*req); });
}

::grpc::Status AdminServer::CancelSession(::grpc::ServerContext*, const CancelSessionRequest* req, SessionResponse* resp) {
  return Guarded([&] { *resp = service_->CancelSession(*req); });
}

::grpc::Status AdminServer::ReleaseVehicle(::grpc::ServerContext*, const ReleaseVehicleRequest* req, SessionResponse* resp) {
  return Guarded([&] { *resp = service_->ReleaseVehicle(*req); });
}

::grpc::Status AdminServer::UpsertAuthorization(::grpc::ServerContext*, const UpsertAuthorizationRequest* req, google::protobuf::Empty*) {
  return Guarded([&] { service_->UpsertAuthorization(*req); });
}

::grpc::Status AdminServer::DeleteAuthorization(::grpc::ServerContext*, const DeleteAuthorizationRequest* req, google::protobuf::Empty*) {
  return Guarded([&] { service_->DeleteAuthorization(*req); });
}

::grpc::Status AdminServer::ListAuthorizations(::grpc::ServerContext*, const google::protobuf::Empty* req, ListAuthorizationsResponse* resp) {
  return Guarded([&] { *resp = service_->ListAuthorizations(*req); });
}

::grpc::Status AdminServer::ListAccessLog(::grpc::ServerContext*, const ListAccessLogRequest* req, ListAccessLogResponse* resp) {
  return Guarded([&] { *resp = service_->ListAccessLog(*req); });
}

} // namespace lotgate::grpc
