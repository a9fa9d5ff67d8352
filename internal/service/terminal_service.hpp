#pragma once

#include <google/protobuf/empty.pb.h>

#include "lotgate/v1/terminal_service.pb.h"
#include "service_context.hpp"

namespace lotgate::service {

/*
  Payment-terminal adapters report transaction outcomes here.
*/
class TerminalService {
 public:
  explicit TerminalService(ServiceContext ctx);

  void ReportTransaction(const lotgate::v1::ReportTransactionRequest& req);

  lotgate::v1::ListPendingResponse ListPending(const google::protobuf::Empty& req);

 private:
  ServiceContext ctx_;
};

} // namespace lotgate::service
