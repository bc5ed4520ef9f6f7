#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace coffer::storage {

namespace detail {

using encoder_t = coffer::schema::encoding::encoder<
    coffer::schema::encoding::scale_encoder_tag>;

inline ROCKSDB_NAMESPACE::Slice to_slice(const coffer::schema::bytes_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline coffer::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return coffer::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

/// Statuses a pessimistic transaction reports when another writer holds the
/// row lock past the configured wait.
inline bool is_lock_failure(const ROCKSDB_NAMESPACE::Status& status) {
  return status.IsBusy() || status.IsTimedOut() || status.IsTryAgain() ||
         status.IsExpired();
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// Durable backend on a RocksDB TransactionDB. Every commit runs in one
/// pessimistic transaction; the txid index entry is read with GetForUpdate,
/// so two writers racing on the same txid serialize on that row lock and the
/// loser sees the winner's committed entry.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;

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
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace coffer::storage
