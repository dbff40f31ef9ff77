#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace shopstack::service {

// Span, request metrics and error log around one service call.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view execution_id, Fn&& fn) {
  shopstack::observability::SpanScope span(route);
  if (!execution_id.empty()) {
    span.SetAttribute("execution.id", execution_id);
  }

  auto& metrics    = shopstack::observability::Metrics::Instance();
  auto  elapsed_ms = [started_at = std::chrono::steady_clock::now()] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SHOPSTACK_LOG_ERROR("RPC failed", {shopstack::observability::StringField("route", route),
                                       shopstack::observability::StringField("error", ex.what()),
                                       shopstack::observability::StringField("execution_id", execution_id)});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace shopstack::service
