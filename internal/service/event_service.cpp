#include "event_service.hpp"

#include "observe_rpc.hpp"

namespace lotgate::service {

namespace {

constexpr std::size_t kDefaultMaxQueue = 1024;

} // namespace

EventService::EventService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::shared_ptr<events::Subscription> EventService::Watch(const lotgate::v1::WatchEventsRequest& req) {
  return ObserveRpc("EventService.WatchEvents", [&] {
    const std::size_t max_queue = req.max_queue() > 0 ? req.max_queue() : kDefaultMaxQueue;
    LOTGATE_LOG_INFO("event watcher attached", {lotgate::observability::IntField("max_queue", static_cast<int64_t>(max_queue))});
    return ctx_.bus->Subscribe(max_queue);
  });
}

void EventService::Unwatch(const std::shared_ptr<events::Subscription>& subscription) {
  ctx_.bus->Unsubscribe(subscription);
  LOTGATE_LOG_INFO("event watcher detached",
                   {lotgate::observability::IntField("dropped", static_cast<int64_t>(subscription->Dropped()))});
}

} // namespace lotgate::service
