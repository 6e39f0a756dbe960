#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace progress::service {

/*
  Wraps one RPC body with a span, request metrics and failure logging.
  Exceptions are rethrown unchanged for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view attribute_key, std::string_view attribute_value, Fn&& fn) {
  observability::SpanScope span(route);
  if (!attribute_value.empty()) {
    span.SetAttribute(attribute_key, attribute_value);
  }

  auto& metrics    = observability::Metrics::Instance();
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
    PROGRESS_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                      observability::StringField(attribute_key, attribute_value)});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace progress::service
