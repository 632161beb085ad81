#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace walship::service {

// Records request count and latency for `route` and logs failures before rethrowing.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view database, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      walship::observability::Metrics::Instance().RecordRequest(route, true);
      walship::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      walship::observability::Metrics::Instance().RecordRequest(route, true);
      walship::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    WALSHIP_LOG_WARN("RPC failed", {walship::observability::StringField("route", route), walship::observability::StringField("database", database),
                                    walship::observability::StringField("error", ex.what())});
    walship::observability::Metrics::Instance().RecordRequest(route, false);
    walship::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace walship::service
