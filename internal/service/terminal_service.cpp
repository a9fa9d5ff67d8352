#include "terminal_service.hpp"

#include "internal/payment/terminal_bridge_processor.hpp"
#include "internal/util/money.hpp"
#include "observe_rpc.hpp"

namespace lotgate::service {

using namespace lotgate::v1;

TerminalService::TerminalService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void TerminalService::ReportTransaction(const ReportTransactionRequest& req) {
  ObserveRpc("TerminalService.ReportTransaction", [&] {
    payment::TransactionUpdate update;
    update.transaction_id = req.transaction_id();
    update.state          = req.state();
    update.payment_method = req.payment_method();
    update.message        = req.message();
    ctx_.terminal->Report(update);
  });
}

ListPendingResponse TerminalService::ListPending(const google::protobuf::Empty&) {
  return ObserveRpc("TerminalService.ListPending", [&] {
    ListPendingResponse resp;
    for (const auto& transaction : ctx_.terminal->ListPending()) {
      auto* out = resp.add_transactions();
      out->set_transaction_id(transaction.transaction_id);
      out->set_session_id(transaction.session_id);
      *out->mutable_amount() = util::ToProto(transaction.amount);
    }
    return resp;
  });
}

} // namespace lotgate::service
