#pragma once
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/wallet_ordering.hpp>
#include <optional>
#include <vector>

namespace coffer::schema {

/// Wallet listing criteria. Unset `active` matches both states; an empty
/// `wallet_ids` matches every wallet.
struct wallet_filter_t final {
  std::optional<bool> active;
  std::vector<wallet_id_t> wallet_ids;
  wallet_ordering_t ordering{kDefaultWalletOrdering};
};

}  // namespace coffer::schema
