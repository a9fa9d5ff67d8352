#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/terminal_service.hpp"
#include "lotgate/v1/terminal_service.grpc.pb.h"

namespace lotgate::grpc {

class TerminalServer final : public lotgate::v1::TerminalService::Service {
 public:
  explicit TerminalServer(std::shared_ptr<lotgate::service::TerminalService> svc);

  ::grpc::Status ReportTransaction(::grpc::ServerContext*, const lotgate::v1::ReportTransactionRequest*,
                                   google::protobuf::Empty*) override;
  ::grpc::Status ListPending(::grpc::ServerContext*, const google::protobuf::Empty*, lotgate::v1::ListPendingResponse*) override;

 private:
  std::shared_ptr<lotgate::service::TerminalService> service_;
};

} // namespace lotgate::grpc
