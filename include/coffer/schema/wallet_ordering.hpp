#pragma once

#include <coffer/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: wallet ordering.
// Sort key for wallet listings. A leading `-` in the string form means
// descending order.
namespace coffer::schema {

enum class wallet_ordering_t : uint8_t {
  balance_ascending = 0,
  balance_descending = 1,
  created_at_ascending = 2,
  created_at_descending = 3,
  updated_at_ascending = 4,
  updated_at_descending = 5,
  label_ascending = 6,
  label_descending = 7
};

inline constexpr auto kWalletOrderingNames = enum_names{std::array{
    std::pair<std::string_view, wallet_ordering_t>{
        "balance", wallet_ordering_t::balance_ascending},
    std::pair<std::string_view, wallet_ordering_t>{
        "-balance", wallet_ordering_t::balance_descending},
    std::pair<std::string_view, wallet_ordering_t>{
        "created_at", wallet_ordering_t::created_at_ascending},
    std::pair<std::string_view, wallet_ordering_t>{
        "-created_at", wallet_ordering_t::created_at_descending},
    std::pair<std::string_view, wallet_ordering_t>{
        "updated_at", wallet_ordering_t::updated_at_ascending},
    std::pair<std::string_view, wallet_ordering_t>{
        "-updated_at", wallet_ordering_t::updated_at_descending},
    std::pair<std::string_view, wallet_ordering_t>{
        "label", wallet_ordering_t::label_ascending},
    std::pair<std::string_view, wallet_ordering_t>{
        "-label", wallet_ordering_t::label_descending}}};

inline constexpr auto kDefaultWalletOrdering =
    wallet_ordering_t::balance_descending;

template <>
inline std::optional<wallet_ordering_t> try_from_string<wallet_ordering_t>(
    const std::string_view value) {
  return kWalletOrderingNames.parse(value);
}

inline constexpr std::string_view to_string(const wallet_ordering_t value) {
  return kWalletOrderingNames.name(value).value_or("unknown");
}

}  // namespace coffer::schema
