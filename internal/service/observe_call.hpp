#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rentledger::service {

// Runs one service call and logs its failure. Ledger rejections are
// warnings, anything else is an error. The exception is rethrown.
template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const util::LedgerError& ex) {
    RENTLEDGER_LOG_WARN("call rejected", {observability::StringField("route", route), observability::StringField("code", util::ToString(ex.code())),
                                          observability::StringField("error", ex.what()), observability::IntField("latency_ms", elapsed_ms())});
    throw;
  } catch (const std::exception& ex) {
    RENTLEDGER_LOG_ERROR("call failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                         observability::IntField("latency_ms", elapsed_ms())});
    throw;
  }
}

} // namespace rentledger::service
