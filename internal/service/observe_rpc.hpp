#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace osforge::service {

/*
  Wraps one RPC body with a span, request metrics and failure logging.
  Exceptions are logged and rethrown for the transport edge to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view build_id, Fn&& fn) {
  osforge::observability::SpanScope span(route);
  if (!build_id.empty()) {
    span.SetAttribute("build.id", build_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    osforge::observability::Metrics::Instance().RecordRequest(route, success);
    osforge::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = fn();
    finish(true);
    return result;
  } catch (const osforge::util::InvalidArgument& ex) {
    span.RecordException(ex.what());
    OSFORGE_LOG_WARN("RPC rejected", {osforge::observability::StringField("route", route), osforge::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    OSFORGE_LOG_ERROR("RPC failed", {osforge::observability::StringField("route", route), osforge::observability::StringField("error", ex.what()),
                                     osforge::observability::StringField("build_id", build_id)});
    finish(false);
    throw;
  }
}

} // namespace osforge::service
