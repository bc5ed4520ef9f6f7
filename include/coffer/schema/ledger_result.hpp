#pragma once

#include <coffer/schema/ledger_error_code.hpp>
#include <optional>
#include <string>
#include <utility>

namespace coffer::schema {

/// Outcome of one ledger operation. `value` is set exactly when `code` is ok;
/// `log` carries a human-readable reason for failures.
template <typename T>
struct ledger_result final {
  ledger_error_code code{ledger_error_code::ok};
  std::string log;
  std::optional<T> value;

  bool ok() const { return code == ledger_error_code::ok; }
};

template <typename T>
ledger_result<T> make_success(T value) {
  return ledger_result<T>{.code = ledger_error_code::ok,
                          .log = {},
                          .value = std::move(value)};
}

template <typename T>
ledger_result<T> make_failure(const ledger_error_code code, std::string log) {
  return ledger_result<T>{
      .code = code, .log = std::move(log), .value = std::nullopt};
}

}  // namespace coffer::schema
