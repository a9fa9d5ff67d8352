#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace lotgate::service {

// Request count and latency per route; failures are logged and rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      lotgate::observability::Metrics::Instance().RecordRpc(route, true, elapsed_ms());
      return;
    } else {
      auto result = fn();
      lotgate::observability::Metrics::Instance().RecordRpc(route, true, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    LOTGATE_LOG_ERROR("RPC failed", {lotgate::observability::StringField("route", route),
                                     lotgate::observability::StringField("error", ex.what())});
    lotgate::observability::Metrics::Instance().RecordRpc(route, false, elapsed_ms());
    throw;
  }
}

} // namespace lotgate::service
