#pragma once
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/transaction_state.hpp>
#include <coffer/schema/wallet_state.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace coffer::storage {

/// Rows written by one atomic commit. Either every row becomes visible or
/// none does.
struct write_set final {
  /// Wallet records to create or overwrite.
  std::vector<coffer::schema::wallet_state_t> wallets;
  /// New transactions. Each one claims its txid in the unique index as part
  /// of the commit; a txid that is already claimed aborts the whole commit.
  std::vector<coffer::schema::transaction_state_t> inserted_transactions;
  /// Existing transactions to overwrite (index entries are left as is).
  std::vector<coffer::schema::transaction_state_t> updated_transactions;
};

enum class commit_status : uint8_t {
  committed = 0,
  /// A txid in `inserted_transactions` is already present; nothing written.
  duplicate_txid = 1,
  /// The backend could not obtain its own row locks in time; nothing
  /// written, safe to retry.
  conflict = 2
};

template <typename Library>
struct storage {
  /// Wallet record by id, or std::nullopt when missing.
  std::optional<coffer::schema::wallet_state_t> load_wallet(
      const coffer::schema::wallet_id_t& wallet_id) const;

  /// Every wallet record in key order.
  std::vector<coffer::schema::wallet_state_t> list_wallets() const;

  /// Transaction record by id, or std::nullopt when missing.
  std::optional<coffer::schema::transaction_state_t> load_transaction(
      const coffer::schema::transaction_id_t& transaction_id) const;

  /// Transaction record by external txid, or std::nullopt when missing.
  std::optional<coffer::schema::transaction_state_t>
  load_transaction_by_txid(std::string_view txid) const;

  /// Transactions of one wallet in creation order.
  std::vector<coffer::schema::transaction_state_t>
  list_transactions_by_wallet(
      const coffer::schema::wallet_id_t& wallet_id) const;

  /// Transactions of several wallets read from one consistent view, grouped
  /// per wallet in argument order, each group in creation order.
  std::vector<coffer::schema::transaction_state_t>
  list_transactions_by_wallets(
      std::span<const coffer::schema::wallet_id_t> wallet_ids) const;

  /// Apply the write set atomically, enforcing txid uniqueness inside the
  /// commit itself.
  commit_status commit(const write_set& changes);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace coffer::storage
