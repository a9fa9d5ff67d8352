#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "lotgate/v1/events.pb.h"

namespace lotgate::events {

using lotgate::v1::DomainEvent;

// Events collected inside a repository transaction, published after commit.
using EventBatch = std::vector<DomainEvent>;

/*
  Bounded per-subscriber queue. When full, the oldest event is dropped.
*/
class Subscription {
 public:
  explicit Subscription(std::size_t max_queue);

  // Blocks up to `timeout`; nullopt on timeout or once closed and drained.
  std::optional<DomainEvent> Next(std::chrono::milliseconds timeout);

  void Close();
  bool Closed() const;

  uint64_t Dropped() const {
    return dropped_.load();
  }

 private:
  friend class EventBus;
  void Push(const DomainEvent& event);

  const std::size_t       max_queue_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<DomainEvent> queue_;
  bool                    closed_ = false;
  std::atomic<uint64_t>   dropped_{0};
};

/*
  In-process fan-out of domain events.

  Handlers run synchronously on the publishing thread, outside the bus
  lock, and must not publish recursively. Streaming consumers use
  Subscribe() instead.
*/
class EventBus {
 public:
  using Handler = std::function<void(const DomainEvent&)>;

  uint64_t AddHandler(Handler handler);
  void     RemoveHandler(uint64_t id);

  std::shared_ptr<Subscription> Subscribe(std::size_t max_queue = 1024);
  void                          Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  // Assigns the sequence number and delivers.
  void Publish(DomainEvent event);
  void PublishAll(EventBatch& batch);

  // Closes every subscription.
  void Shutdown();

 private:
  std::mutex                                 mutex_;
  uint64_t                                   next_sequence_   = 1;
  uint64_t                                   next_handler_id_ = 1;
  std::vector<std::pair<uint64_t, Handler>>  handlers_;
  std::vector<std::shared_ptr<Subscription>> subscriptions_;
};

} // namespace lotgate::events
