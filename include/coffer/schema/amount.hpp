#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: amount.
// Fixed-point decimal with two fractional digits, held as a signed count of
// minor units. Used for both transaction deltas and wallet balances.
namespace coffer::schema {

inline constexpr auto kAmountFractionDigits = 2u;
inline constexpr auto kAmountMinorPerUnit = int64_t{100};

struct amount_t final {
  int64_t minor_units{};

  auto operator<=>(const amount_t&) const = default;
};

inline constexpr amount_t make_amount_minor(const int64_t minor_units) {
  return amount_t{.minor_units = minor_units};
}

inline constexpr bool is_zero(const amount_t& value) {
  return value.minor_units == 0;
}

inline constexpr bool is_negative(const amount_t& value) {
  return value.minor_units < 0;
}

/// Parse `[+-]digits[.d[d]]`. Returns std::nullopt on malformed input, more
/// than two fractional digits, or values outside the 64-bit minor-unit range.
std::optional<amount_t> try_parse_amount(const std::string_view text);

/// Always renders two fractional digits, e.g. `-30.00`.
std::string to_string(const amount_t& value);

/// Checked addition; std::nullopt when the sum leaves the representable range.
std::optional<amount_t> checked_add(const amount_t& lhs, const amount_t& rhs);

}  // namespace coffer::schema
