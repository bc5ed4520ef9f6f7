#pragma once
#include <coffer/storage/storage.hpp>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <utility>

namespace coffer::storage {

struct memory_storage_tag {};

/// In-process backend. One reader/writer lock guards all tables: commits take
/// it exclusively (the txid check and the inserts happen under the same
/// hold), reads take it shared, so a reader sees a commit entirely or not at
/// all.
template <>
struct storage<memory_storage_tag> final {
  std::optional<coffer::schema::wallet_state_t> load_wallet(
      const coffer::schema::wallet_id_t& wallet_id) const;
  std::vector<coffer::schema::wallet_state_t> list_wallets() const;
  std::optional<coffer::schema::transaction_state_t> load_transaction(
      const coffer::schema::transaction_id_t& transaction_id) const;
  std::optional<coffer::schema::transaction_state_t>
  load_transaction_by_txid(std::string_view txid) const;
  std::vector<coffer::schema::transaction_state_t>
  list_transactions_by_wallet(
      const coffer::schema::wallet_id_t& wallet_id) const;
  std::vector<coffer::schema::transaction_state_t>
  list_transactions_by_wallets(
      std::span<const coffer::schema::wallet_id_t> wallet_ids) const;
  commit_status commit(const write_set& changes);

 private:
  void append_wallet_transactions(
      const coffer::schema::wallet_id_t& wallet_id,
      std::vector<coffer::schema::transaction_state_t>& out) const;

  mutable std::shared_mutex mutex_;
  std::map<coffer::schema::wallet_id_t, coffer::schema::wallet_state_t>
      wallets_;
  std::map<coffer::schema::transaction_id_t,
           coffer::schema::transaction_state_t>
      transactions_;
  std::map<std::string, coffer::schema::transaction_id_t, std::less<>>
      txid_index_;
  std::map<std::pair<coffer::schema::wallet_id_t, uint64_t>,
           coffer::schema::transaction_id_t>
      wallet_index_;
};

/// `path` is ignored; present so fixtures can treat both backends alike.
template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

}  // namespace coffer::storage
