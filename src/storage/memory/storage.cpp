#include <spdlog/spdlog.h>
#include <coffer/common/critical.hpp>
#include <coffer/storage/memory/storage.hpp>

#include <mutex>
#include <set>

using namespace coffer::schema;

namespace coffer::storage {

std::optional<wallet_state_t> storage<memory_storage_tag>::load_wallet(
    const wallet_id_t& wallet_id) const {
  auto lock = std::shared_lock{mutex_};
  auto found = wallets_.find(wallet_id);
  if (found == std::end(wallets_)) {
    return std::nullopt;
  }
  return found->second;
}

std::vector<wallet_state_t> storage<memory_storage_tag>::list_wallets() const {
  auto lock = std::shared_lock{mutex_};
  auto wallets = std::vector<wallet_state_t>{};
  wallets.reserve(wallets_.size());
  for (const auto& [id, wallet] : wallets_) {
    wallets.push_back(wallet);
  }
  return wallets;
}

std::optional<transaction_state_t>
storage<memory_storage_tag>::load_transaction(
    const transaction_id_t& transaction_id) const {
  auto lock = std::shared_lock{mutex_};
  auto found = transactions_.find(transaction_id);
  if (found == std::end(transactions_)) {
    return std::nullopt;
  }
  return found->second;
}

std::optional<transaction_state_t>
storage<memory_storage_tag>::load_transaction_by_txid(
    const std::string_view txid) const {
  auto lock = std::shared_lock{mutex_};
  auto indexed = txid_index_.find(txid);
  if (indexed == std::end(txid_index_)) {
    return std::nullopt;
  }
  return transactions_.at(indexed->second);
}

std::vector<transaction_state_t>
storage<memory_storage_tag>::list_transactions_by_wallet(
    const wallet_id_t& wallet_id) const {
  auto lock = std::shared_lock{mutex_};
  auto transactions = std::vector<transaction_state_t>{};
  append_wallet_transactions(wallet_id, transactions);
  return transactions;
}

std::vector<transaction_state_t>
storage<memory_storage_tag>::list_transactions_by_wallets(
    const std::span<const wallet_id_t> wallet_ids) const {
  auto lock = std::shared_lock{mutex_};
  auto transactions = std::vector<transaction_state_t>{};
  auto seen = std::set<wallet_id_t>{};
  for (const auto& wallet_id : wallet_ids) {
    if (seen.insert(wallet_id).second) {
      append_wallet_transactions(wallet_id, transactions);
    }
  }
  return transactions;
}

commit_status storage<memory_storage_tag>::commit(const write_set& changes) {
  auto lock = std::unique_lock{mutex_};

  // Validate every inserted txid before touching any table.
  auto claimed = std::set<std::string_view>{};
  for (const auto& tx : changes.inserted_transactions) {
    if (txid_index_.contains(tx.txid) || !claimed.insert(tx.txid).second) {
      spdlog::debug("Rejecting duplicate txid '{}'", tx.txid);
      return commit_status::duplicate_txid;
    }
  }
  for (const auto& tx : changes.updated_transactions) {
    if (!transactions_.contains(tx.transaction_id)) {
      coffer::common::critical("update of a transaction that was never stored");
    }
  }

  for (const auto& tx : changes.inserted_transactions) {
    txid_index_.emplace(tx.txid, tx.transaction_id);
    wallet_index_.insert_or_assign(std::pair{tx.wallet_id, tx.sequence},
                                   tx.transaction_id);
    transactions_.insert_or_assign(tx.transaction_id, tx);
  }
  for (const auto& tx : changes.updated_transactions) {
    transactions_.insert_or_assign(tx.transaction_id, tx);
  }
  for (const auto& wallet : changes.wallets) {
    wallets_.insert_or_assign(wallet.wallet_id, wallet);
  }
  return commit_status::committed;
}

void storage<memory_storage_tag>::append_wallet_transactions(
    const wallet_id_t& wallet_id,
    std::vector<transaction_state_t>& out) const {
  auto first = wallet_index_.lower_bound(std::pair{wallet_id, uint64_t{0}});
  for (auto it = first;
       it != std::end(wallet_index_) && it->first.first == wallet_id; ++it) {
    out.push_back(transactions_.at(it->second));
  }
}

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  static_cast<void>(path);
  spdlog::debug("Using in-memory ledger storage");
  return storage<memory_storage_tag>{};
}

}  // namespace coffer::storage
