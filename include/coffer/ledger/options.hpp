#pragma once

#include <coffer/schema/primitives.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <stop_token>

namespace coffer::ledger {

inline constexpr auto kDefaultLockTimeout = std::chrono::milliseconds{5000};
inline constexpr auto kDefaultMaxLabelLength = std::size_t{255};
inline constexpr auto kDefaultMaxTxidLength = std::size_t{255};

/// Service-wide settings.
struct options final {
  /// Wait applied when a call does not supply its own.
  std::chrono::milliseconds lock_timeout{kDefaultLockTimeout};
  /// Limits in bytes, measured after trimming.
  std::size_t max_label_length{kDefaultMaxLabelLength};
  std::size_t max_txid_length{kDefaultMaxTxidLength};
  /// When false a debit that would take the balance below zero fails with
  /// insufficient_balance.
  bool allow_negative_balance{false};
  std::function<coffer::schema::timestamp_milliseconds_t()> clock{
      &coffer::schema::now_milliseconds};
};

/// Per-call settings for mutating operations.
struct call_options final {
  std::optional<std::chrono::milliseconds> lock_timeout;
  std::stop_token stop_token;
};

}  // namespace coffer::ledger
