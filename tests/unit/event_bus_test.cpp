#include "internal/events/event_bus.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/events/domain_events.hpp"
#include "internal/util/time.hpp"

namespace {

using lotgate::events::EventBatch;
using lotgate::events::EventBus;
using lotgate::v1::DomainEvent;
using namespace std::chrono_literals;

DomainEvent Opened(const std::string& session_id) {
  return lotgate::events::MakeSessionOpened(session_id, "ABC123", lotgate::util::Now());
}

void TestHandlersSeeSequencedEvents() {
  EventBus              bus;
  std::vector<uint64_t> sequences;
  bus.AddHandler([&](const DomainEvent& event) { sequences.push_back(event.sequence()); });

  bus.Publish(Opened("s1"));
  bus.Publish(Opened("s2"));

  assert(sequences.size() == 2);
  assert(sequences[0] == 1);
  assert(sequences[1] == 2);
}

void TestFailingHandlerDoesNotStopDelivery() {
  EventBus bus;
  int      delivered = 0;
  bus.AddHandler([](const DomainEvent&) { throw std::runtime_error("handler broke"); });
  auto id = bus.AddHandler([&](const DomainEvent&) { ++delivered; });

  bus.Publish(Opened("s1"));
  assert(delivered == 1);

  bus.RemoveHandler(id);
  bus.Publish(Opened("s2"));
  assert(delivered == 1);
}

void TestPublishAllPreservesOrderAndDrainsBatch() {
  EventBus   bus;
  auto       subscription = bus.Subscribe();
  EventBatch batch{Opened("s1"), Opened("s2"), Opened("s3")};

  bus.PublishAll(batch);
  assert(batch.empty());

  for (const char* expected : {"s1", "s2", "s3"}) {
    auto event = subscription->Next(100ms);
    assert(event.has_value());
    assert(event->session_opened().session_id() == expected);
  }
  assert(!subscription->Next(10ms).has_value());
}

void TestSlowSubscriberDropsOldest() {
  EventBus bus;
  auto     subscription = bus.Subscribe(2);

  bus.Publish(Opened("s1"));
  bus.Publish(Opened("s2"));
  bus.Publish(Opened("s3"));

  assert(subscription->Dropped() == 1);
  assert(subscription->Next(10ms)->session_opened().session_id() == "s2");
  assert(subscription->Next(10ms)->session_opened().session_id() == "s3");
}

void TestShutdownWakesBlockedSubscriber() {
  EventBus bus;
  auto     subscription = bus.Subscribe();

  std::thread closer([&] {
    std::this_thread::sleep_for(50ms);
    bus.Shutdown();
  });

  const auto started = std::chrono::steady_clock::now();
  auto       event   = subscription->Next(5000ms);
  closer.join();

  assert(!event.has_value());
  assert(subscription->Closed());
  assert(std::chrono::steady_clock::now() - started < 4000ms);
}

} // namespace

int main() {
  TestHandlersSeeSequencedEvents();
  TestFailingHandlerDoesNotStopDelivery();
  TestPublishAllPreservesOrderAndDrainsBatch();
  TestSlowSubscriberDropsOldest();
  TestShutdownWakesBlockedSubscriber();

  std::cout << "lotgate_unit_event_bus: pass\n";
  return 0;
}
