#pragma once

#include <coffer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: ledger error code.
// Typed failure reported by every ledger operation; 0 means success.
namespace coffer::schema {

enum class ledger_error_code : uint32_t {
  ok = 0,
  wallet_not_found = 1,
  wallet_inactive = 2,
  duplicate_transaction_id = 3,
  invalid_label = 4,
  lock_timeout = 5,
  cancelled = 6,
  invalid_transaction_id = 7,
  invalid_amount = 8,
  balance_overflow = 9,
  insufficient_balance = 10,
  transaction_not_found = 11,
};

inline constexpr auto kLedgerErrorCodeNames = enum_names{std::array{
    std::pair<std::string_view, ledger_error_code>{"ok", ledger_error_code::ok},
    std::pair<std::string_view, ledger_error_code>{
        "wallet_not_found", ledger_error_code::wallet_not_found},
    std::pair<std::string_view, ledger_error_code>{
        "wallet_inactive", ledger_error_code::wallet_inactive},
    std::pair<std::string_view, ledger_error_code>{
        "duplicate_transaction_id",
        ledger_error_code::duplicate_transaction_id},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_label", ledger_error_code::invalid_label},
    std::pair<std::string_view, ledger_error_code>{
        "lock_timeout", ledger_error_code::lock_timeout},
    std::pair<std::string_view, ledger_error_code>{
        "cancelled", ledger_error_code::cancelled},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_transaction_id", ledger_error_code::invalid_transaction_id},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_amount", ledger_error_code::invalid_amount},
    std::pair<std::string_view, ledger_error_code>{
        "balance_overflow", ledger_error_code::balance_overflow},
    std::pair<std::string_view, ledger_error_code>{
        "insufficient_balance", ledger_error_code::insufficient_balance},
    std::pair<std::string_view, ledger_error_code>{
        "transaction_not_found", ledger_error_code::transaction_not_found}}};

template <>
inline std::optional<ledger_error_code> try_from_string<ledger_error_code>(
    const std::string_view value) {
  return kLedgerErrorCodeNames.parse(value);
}

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return kLedgerErrorCodeNames.name(value).value_or("unknown");
}

/// Only a lock timeout may be resubmitted unchanged; every other failure
/// repeats for the same input.
inline constexpr bool is_retryable(const ledger_error_code value) {
  return value == ledger_error_code::lock_timeout;
}

}  // namespace coffer::schema
