#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/util/time.hpp"

namespace lotgate::parking {

class SessionManager;

// Periodically cancels PENDING_PAYMENT sessions whose terminal never
// answered within parking.payment_timeout, then prunes settled
// transactions from the payment processor. Expiry is off for a zero
// timeout; pruning always runs.
class PaymentTimeoutWorker {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  PaymentTimeoutWorker(std::shared_ptr<SessionManager> sessions, std::chrono::milliseconds interval, ClockFn clock = util::Now);
  ~PaymentTimeoutWorker();

  void Start();
  void Stop();

  // One sweep on the calling thread. Returns the sessions cancelled.
  std::size_t SweepOnce();

  std::size_t TotalExpired() const { return total_expired_.load(); }

 private:
  void Run();

  std::shared_ptr<SessionManager> sessions_;
  std::chrono::milliseconds       interval_;
  ClockFn                         clock_;
  std::atomic<std::size_t>        total_expired_{0};

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace lotgate::parking
