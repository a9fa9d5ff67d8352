#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/event_service.hpp"
#include "lotgate/v1/event_service.grpc.pb.h"

namespace lotgate::grpc {

/*
  Server-streaming domain events. Each call owns a bus subscription until
  the client cancels or the bus shuts down.
*/
class EventServer final : public lotgate::v1::EventService::Service {
 public:
  explicit EventServer(std::shared_ptr<lotgate::service::EventService> svc);

  ::grpc::Status WatchEvents(::grpc::ServerContext*, const lotgate::v1::WatchEventsRequest*,
                             ::grpc::ServerWriter<lotgate::v1::DomainEvent>*) override;

 private:
  std::shared_ptr<lotgate::service::EventService> service_;
};

} // namespace lotgate::grpc
