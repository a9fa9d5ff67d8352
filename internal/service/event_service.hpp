#pragma once

#include <memory>

#include "internal/events/event_bus.hpp"
#include "lotgate/v1/event_service.pb.h"
#include "service_context.hpp"

namespace lotgate::service {

class EventService {
 public:
  explicit EventService(ServiceContext ctx);

  std::shared_ptr<events::Subscription> Watch(const lotgate::v1::WatchEventsRequest& req);
  void                                  Unwatch(const std::shared_ptr<events::Subscription>& subscription);

 private:
  ServiceContext ctx_;
};

} // namespace lotgate::service
