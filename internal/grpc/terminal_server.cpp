#include "terminal_server.hpp"

#include "grpc_error.hpp"

namespace lotgate::grpc {

using namespace lotgate::v1;

TerminalServer::TerminalServer(std::shared_ptr<lotgate::service::TerminalService> svc) : service_(std::move(svc)) {
}

::grpc::Status TerminalServer::ReportTransaction(::grpc::ServerContext*, const ReportTransactionRequest* req,
                                                 google::protobuf::Empty*) {
  return Guarded([&] { service_->ReportTransaction(*req); });
}

::grpc::Status TerminalServer::ListPending(::grpc::ServerContext*, const google::protobuf::Empty* req,
                                           ListPendingResponse* resp) {
  return Guarded([&] { *resp = service_->ListPending(*req); });
}

} // namespace lotgate::grpc
