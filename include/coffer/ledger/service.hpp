#pragma once

#include <coffer/ledger/options.hpp>
#include <coffer/ledger/wallet_lock_table.hpp>
#include <coffer/schema/amount.hpp>
#include <coffer/schema/ledger_error_code.hpp>
#include <coffer/schema/ledger_result.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/transaction_state.hpp>
#include <coffer/schema/wallet_filter.hpp>
#include <coffer/schema/wallet_state.hpp>
#include <coffer/storage/memory/storage.hpp>
#include <coffer/storage/rocksdb/storage.hpp>
#include <coffer/storage/storage.hpp>
#include <span>
#include <string_view>
#include <vector>

namespace coffer::ledger {

/// Wallet ledger over one storage backend.
///
/// Every mutation of a wallet runs inside that wallet's exclusive section in
/// `locks` and ends in a single storage commit, so a failed call leaves
/// storage exactly as it found it. Reads never take the exclusive section.
template <typename Library>
class service final {
 public:
  using storage_t = coffer::storage::storage<Library>;

  service(storage_t& storage, wallet_lock_table& locks, options settings = {});

  /// Validate `label` and persist a new active wallet with zero balance.
  coffer::schema::ledger_result<coffer::schema::wallet_state_t> create_wallet(
      std::string_view label);

  /// Record `amount` against `wallet_id` under external id `txid` and move the
  /// balance by the same amount. The txid claim and the balance update commit
  /// together; a txid already present anywhere fails with
  /// duplicate_transaction_id and changes nothing.
  coffer::schema::ledger_result<coffer::schema::transaction_state_t>
  apply_transaction(const coffer::schema::wallet_id_t& wallet_id,
                    std::string_view txid,
                    const coffer::schema::amount_t& amount,
                    const call_options& call = {});

  /// Deactivate the wallet and every one of its transactions in one commit.
  /// Deactivating an inactive wallet succeeds and returns it unchanged.
  coffer::schema::ledger_result<coffer::schema::wallet_state_t>
  deactivate_wallet(const coffer::schema::wallet_id_t& wallet_id,
                    const call_options& call = {});

  /// Replace the label of an active or deactivated wallet.
  coffer::schema::ledger_result<coffer::schema::wallet_state_t> update_label(
      const coffer::schema::wallet_id_t& wallet_id,
      std::string_view label,
      const call_options& call = {});

  /// Transactions of the listed wallets from one consistent view. Unknown ids
  /// contribute nothing.
  std::vector<coffer::schema::transaction_state_t> search_transactions(
      std::span<const coffer::schema::wallet_id_t> wallet_ids) const;

  coffer::schema::ledger_result<coffer::schema::wallet_state_t> get_wallet(
      const coffer::schema::wallet_id_t& wallet_id) const;

  std::vector<coffer::schema::wallet_state_t> list_wallets(
      const coffer::schema::wallet_filter_t& filter = {}) const;

  coffer::schema::ledger_result<coffer::schema::transaction_state_t>
  get_transaction(std::string_view txid) const;

  const options& settings() const { return options_; }

 private:
  wallet_lock_table::acquisition lock_wallet(
      const coffer::schema::wallet_id_t& wallet_id,
      const call_options& call);

  storage_t& storage_;
  wallet_lock_table& locks_;
  options options_;
};

extern template class service<coffer::storage::rocksdb_storage_tag>;
extern template class service<coffer::storage::memory_storage_tag>;

}  // namespace coffer::ledger
