#include "event_server.hpp"

#include <chrono>

#include "grpc_error.hpp"

namespace lotgate::grpc {

using namespace lotgate::v1;

namespace {

// How often a blocked stream re-checks for client cancellation.
constexpr std::chrono::milliseconds kPollInterval{250};

} // namespace

EventServer::EventServer(std::shared_ptr<lotgate::service::EventService> svc) : service_(std::move(svc)) {
}

::grpc::Status EventServer::WatchEvents(::grpc::ServerContext* context, const WatchEventsRequest* req,
                                        ::grpc::ServerWriter<DomainEvent>* writer) {
  std::shared_ptr<lotgate::events::Subscription> subscription;
  if (auto status = Guarded([&] { subscription = service_->Watch(*req); }); !status.ok()) {
    return status;
  }

  while (!context->IsCancelled()) {
    auto event = subscription->Next(kPollInterval);
    if (!event) {
      if (subscription->Closed()) break;
      continue;
    }
    if (!writer->Write(*event)) break;
  }

  service_->Unwatch(subscription);
  return ::grpc::Status::OK;
}

} // namespace lotgate::grpc
