#pragma once

#include <exception>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"

namespace roster::service {

/*
  Runs one service operation. Failures are logged with the route name and
  rethrown unchanged; the caller's transaction has already rolled back.
*/
template <typename Fn>
auto Observe(std::string_view route, Fn&& fn) -> decltype(fn()) {
  try {
    return std::forward<Fn>(fn)();
  } catch (const std::exception& ex) {
    ROSTER_LOG_ERROR("operation failed", {roster::observability::StringField("route", route),
                                          roster::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace roster::service
