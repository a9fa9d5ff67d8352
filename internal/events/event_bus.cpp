#include "internal/events/event_bus.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace lotgate::events {

Subscription::Subscription(std::size_t max_queue) : max_queue_(std::max<std::size_t>(1, max_queue)) {
}

void Subscription::Push(const DomainEvent& event) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    if (queue_.size() >= max_queue_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
}

std::optional<DomainEvent> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  DomainEvent event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

uint64_t EventBus::AddHandler(Handler handler) {
  std::lock_guard lock(mutex_);
  auto            id = next_handler_id_++;
  handlers_.emplace_back(id, std::move(handler));
  return id;
}

void EventBus::RemoveHandler(uint64_t id) {
  std::lock_guard lock(mutex_);
  std::erase_if(handlers_, [&](const auto& item) { return item.first == id; });
}

std::shared_ptr<Subscription> EventBus::Subscribe(std::size_t max_queue) {
  auto            subscription = std::make_shared<Subscription>(max_queue);
  std::lock_guard lock(mutex_);
  subscriptions_.push_back(subscription);
  return subscription;
}

void EventBus::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  subscription->Close();
  std::lock_guard lock(mutex_);
  std::erase(subscriptions_, subscription);
}

void EventBus::Publish(DomainEvent event) {
  std::vector<Handler>                       handlers;
  std::vector<std::shared_ptr<Subscription>> subscriptions;
  {
    std::lock_guard lock(mutex_);
    event.set_sequence(next_sequence_++);
    handlers.reserve(handlers_.size());
    for (const auto& [_, handler] : handlers_) {
      handlers.push_back(handler);
    }
    subscriptions = subscriptions_;
  }

  for (const auto& handler : handlers) {
    try {
      handler(event);
    } catch (const std::exception& e) {
      LOTGATE_LOG_ERROR("event handler failed", {observability::StringField("error", e.what())});
    }
  }
  for (const auto& subscription : subscriptions) {
    subscription->Push(event);
  }
}

void EventBus::PublishAll(EventBatch& batch) {
  for (auto& event : batch) {
    Publish(std::move(event));
  }
  batch.clear();
}

void EventBus::Shutdown() {
  std::vector<std::shared_ptr<Subscription>> subscriptions;
  {
    std::lock_guard lock(mutex_);
    subscriptions.swap(subscriptions_);
  }
  for (const auto& subscription : subscriptions) {
    subscription->Close();
  }
}

} // namespace lotgate::events
