#pragma once
#include <coffer/schema/amount.hpp>
#include <coffer/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: wallet state.
// Persisted wallet record. `balance` is the denormalized sum of every
// transaction applied to the wallet; `transaction_count` is the next
// per-wallet sequence number and orders the wallet's transaction index.
namespace coffer::schema {

template <uint16_t Version>
struct wallet_state;

template <>
struct wallet_state<1> final {
  uint16_t version{1};
  wallet_id_t wallet_id{};
  std::string label;
  amount_t balance{};
  bool active{true};
  std::optional<timestamp_milliseconds_t> deactivated_at;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  uint64_t transaction_count{};

  bool operator==(const wallet_state&) const = default;
};

using wallet_state_t = wallet_state<1>;

}  // namespace coffer::schema
