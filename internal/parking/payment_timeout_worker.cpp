#include "payment_timeout_worker.hpp"

#include "internal/observability/logging.hpp"
#include "session_manager.hpp"

namespace lotgate::parking {

PaymentTimeoutWorker::PaymentTimeoutWorker(std::shared_ptr<SessionManager> sessions, std::chrono::milliseconds interval, ClockFn clock)
    : sessions_(std::move(sessions)), interval_(interval), clock_(std::move(clock)) {
}

PaymentTimeoutWorker::~PaymentTimeoutWorker() {
  Stop();
}

void PaymentTimeoutWorker::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;

  running_ = true;
  thread_  = std::thread(&PaymentTimeoutWorker::Run, this);
  LOTGATE_LOG_DEBUG("payment timeout sweep started",
                    {observability::IntField("interval_ms", interval_.count()),
                     observability::IntField("timeout_ms", sessions_->Options().payment_timeout.count())});
}

void PaymentTimeoutWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::size_t PaymentTimeoutWorker::SweepOnce() {
  const auto now     = clock_();
  const auto expired = sessions_->ExpireStalePayments(now);
  total_expired_ += expired;
  if (expired > 0) {
    LOTGATE_LOG_INFO("expired stale payments", {observability::IntField("count", static_cast<int64_t>(expired))});
  }
  sessions_->PruneSettledPayments(now);
  return expired;
}

void PaymentTimeoutWorker::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!cv_.wait_for(lock, interval_, [this] { return !running_; })) {
    lock.unlock();
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      LOTGATE_LOG_ERROR("payment timeout sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace lotgate::parking
