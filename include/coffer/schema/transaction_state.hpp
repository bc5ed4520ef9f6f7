#pragma once
#include <coffer/schema/amount.hpp>
#include <coffer/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: transaction state.
// Persisted transaction record. Immutable after insertion except for the
// active flag and timestamps touched by wallet deactivation.
namespace coffer::schema {

template <uint16_t Version>
struct transaction_state;

template <>
struct transaction_state<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  wallet_id_t wallet_id{};
  std::string txid;
  amount_t amount{};
  bool active{true};
  std::optional<timestamp_milliseconds_t> deactivated_at;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  uint64_t sequence{};

  bool operator==(const transaction_state&) const = default;
};

using transaction_state_t = transaction_state<1>;

/// Amounts are never zero once applied, so anything else is a debit.
inline bool is_credit(const transaction_state_t& tx) {
  return tx.amount.minor_units > 0;
}

}  // namespace coffer::schema
