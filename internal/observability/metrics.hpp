#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace lotgate::runtime::config {
class RuntimeConfig;
}

namespace lotgate::observability {

// Starts the OTLP exporter when observability.metrics_enabled is set.
bool InitializeMetrics(const lotgate::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Lot instruments, exported as:

    lotgate.rpc.count / lotgate.rpc.latency_ms     route, ok
    lotgate.decision.count                         direction, reason, granted
    lotgate.decision.latency_ms                    detection in to decision out
    lotgate.barrier.transitions                    barrier, state
    lotgate.payment.count                          outcome
    lotgate.sessions.open                          gauge

  Without ENABLE_OTEL every call is a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRpc(std::string_view route, bool ok, double latency_ms);
  void RecordDecision(std::string_view direction, std::string_view reason, bool granted);
  void ObserveDecisionLatencyMs(double latency_ms);
  void RecordBarrierState(std::string_view barrier_id, std::string_view state);
  void RecordPayment(std::string_view outcome);
  void SetOpenSessions(std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Instruments;
  std::unique_ptr<Instruments> instruments_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const lotgate::runtime::config::RuntimeConfig&) { return false; }
inline void ShutdownMetrics() {}

inline Metrics::Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRpc(std::string_view, bool, double) {}
inline void Metrics::RecordDecision(std::string_view, std::string_view, bool) {}
inline void Metrics::ObserveDecisionLatencyMs(double) {}
inline void Metrics::RecordBarrierState(std::string_view, std::string_view) {}
inline void Metrics::RecordPayment(std::string_view) {}
inline void Metrics::SetOpenSessions(std::int64_t) {}
#endif

} // namespace lotgate::observability
