#include <rocksdb/iterator.h>
#include <rocksdb/snapshot.h>
#include <spdlog/spdlog.h>
#include <coffer/common/critical.hpp>
#include <coffer/schema/key/ledger_keys.hpp>
#include <coffer/storage/rocksdb/storage.hpp>

#include <set>
#include <string>
#include <utility>

using namespace coffer::schema;

namespace coffer::storage {

namespace {

// Reads go through the DB base so the convenience overloads of Get and
// NewIterator are not hidden by the transaction layer.
using db_t = ROCKSDB_NAMESPACE::DB;

db_t& require_open(
    const std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB>& database) {
  if (!database) {
    coffer::common::critical("RocksDB database is not initialized");
  }
  return *database;
}

template <typename T>
T decode_record(const bytes_view_t& key, const bytes_view_t& value) {
  auto encoder = detail::encoder_t{};
  auto record = encoder.try_decode<T>(value);
  if (!record) {
    coffer::common::critical("Undecodable record under key {} ({} bytes)",
                             to_hex(key), value.size());
  }
  return std::move(*record);
}

template <typename T>
std::optional<T> read_record(db_t& database,
                             const ROCKSDB_NAMESPACE::ReadOptions& options,
                             const bytes_t& key) {
  auto value = std::string{};
  auto status = database.Get(options, detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    coffer::common::critical("Failed to get value from RocksDB: {}",
                             status.ToString());
  }
  return decode_record<T>(make_bytes_view(key),
                         make_bytes_view(std::string_view{value}));
}

std::optional<transaction_id_t> read_index_entry(
    db_t& database,
    const ROCKSDB_NAMESPACE::ReadOptions& options,
    const bytes_t& key) {
  auto value = std::string{};
  auto status = database.Get(options, detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    coffer::common::critical("Failed to read index entry from RocksDB: {}",
                             status.ToString());
  }
  return make_uuid(make_bytes_view(std::string_view{value}));
}

void append_wallet_transactions(db_t& database,
                                const ROCKSDB_NAMESPACE::ReadOptions& options,
                                const wallet_id_t& wallet_id,
                                std::vector<transaction_state_t>& out) {
  auto prefix = key::make_wallet_transaction_prefix(wallet_id);
  auto prefix_view = make_string_view(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database.NewIterator(options)};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    auto transaction_id =
        make_uuid(detail::to_bytes_view(iterator->value()));
    auto record = read_record<transaction_state_t>(
        database, options, key::make_transaction_key(transaction_id));
    if (!record) {
      coffer::common::critical(
          "Wallet index of {} references missing transaction {}",
          to_string(wallet_id), to_string(transaction_id));
    }
    out.push_back(std::move(*record));
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("Wallet index scan failed: {}",
                  iterator->status().ToString());
    coffer::common::critical("Failed to scan wallet transaction index");
  }
}

}  // namespace

std::optional<wallet_state_t> storage<rocksdb_storage_tag>::load_wallet(
    const wallet_id_t& wallet_id) const {
  auto& db = require_open(database);
  return read_record<wallet_state_t>(db,
                                     ROCKSDB_NAMESPACE::ReadOptions{},
                                     key::make_wallet_key(wallet_id));
}

std::vector<wallet_state_t> storage<rocksdb_storage_tag>::list_wallets()
    const {
  auto& db = require_open(database);
  auto wallets = std::vector<wallet_state_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      db.NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(std::string{key::kWalletKeyPrefix});
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(key::kWalletKeyPrefix)) {
      break;
    }
    wallets.push_back(
        decode_record<wallet_state_t>(detail::to_bytes_view(iterator->key()),
                                      detail::to_bytes_view(iterator->value())));
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("Wallet scan failed: {}", iterator->status().ToString());
    coffer::common::critical("Failed to scan wallets");
  }
  return wallets;
}

std::optional<transaction_state_t>
storage<rocksdb_storage_tag>::load_transaction(
    const transaction_id_t& transaction_id) const {
  auto& db = require_open(database);
  return read_record<transaction_state_t>(
      db, ROCKSDB_NAMESPACE::ReadOptions{},
      key::make_transaction_key(transaction_id));
}

std::optional<transaction_state_t>
storage<rocksdb_storage_tag>::load_transaction_by_txid(
    const std::string_view txid) const {
  auto& db = require_open(database);
  auto snapshot = ROCKSDB_NAMESPACE::ManagedSnapshot{&db};
  auto options = ROCKSDB_NAMESPACE::ReadOptions{};
  options.snapshot = snapshot.snapshot();

  auto transaction_id =
      read_index_entry(db, options, key::make_txid_key(txid));
  if (!transaction_id) {
    return std::nullopt;
  }
  auto record = read_record<transaction_state_t>(
      db, options, key::make_transaction_key(*transaction_id));
  if (!record) {
    coffer::common::critical("txid index references a missing transaction");
  }
  return record;
}

std::vector<transaction_state_t>
storage<rocksdb_storage_tag>::list_transactions_by_wallet(
    const wallet_id_t& wallet_id) const {
  auto& db = require_open(database);
  auto snapshot = ROCKSDB_NAMESPACE::ManagedSnapshot{&db};
  auto options = ROCKSDB_NAMESPACE::ReadOptions{};
  options.snapshot = snapshot.snapshot();

  auto transactions = std::vector<transaction_state_t>{};
  append_wallet_transactions(db, options, wallet_id, transactions);
  return transactions;
}

std::vector<transaction_state_t>
storage<rocksdb_storage_tag>::list_transactions_by_wallets(
    const std::span<const wallet_id_t> wallet_ids) const {
  auto& db = require_open(database);
  auto snapshot = ROCKSDB_NAMESPACE::ManagedSnapshot{&db};
  auto options = ROCKSDB_NAMESPACE::ReadOptions{};
  options.snapshot = snapshot.snapshot();

  auto transactions = std::vector<transaction_state_t>{};
  auto seen = std::set<wallet_id_t>{};
  for (const auto& wallet_id : wallet_ids) {
    if (!seen.insert(wallet_id).second) {
      continue;
    }
    append_wallet_transactions(db, options, wallet_id, transactions);
  }
  return transactions;
}

commit_status storage<rocksdb_storage_tag>::commit(const write_set& changes) {
  static_cast<void>(require_open(database));
  auto encoder = detail::encoder_t{};
  auto txn = std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
      database->BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{},
                                 ROCKSDB_NAMESPACE::TransactionOptions{})};

  auto abort = [&](const commit_status status) {
    auto rollback_status = txn->Rollback();
    if (!rollback_status.ok()) {
      spdlog::error("Failed to roll back RocksDB transaction: {}",
                    rollback_status.ToString());
      coffer::common::critical("Failed to roll back RocksDB transaction");
    }
    return status;
  };

  // Returns false when the row lock could not be taken.
  auto put = [&](const bytes_t& key, const bytes_t& value) {
    auto status = txn->Put(detail::to_slice(key), detail::to_slice(value));
    if (detail::is_lock_failure(status)) {
      spdlog::warn("RocksDB row lock unavailable: {}", status.ToString());
      return false;
    }
    if (!status.ok()) {
      spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
      coffer::common::critical("Failed to put value into RocksDB");
    }
    return true;
  };

  for (const auto& tx : changes.inserted_transactions) {
    auto txid_key = key::make_txid_key(tx.txid);
    auto existing = std::string{};
    auto status = txn->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                    detail::to_slice(txid_key), &existing);
    if (status.ok()) {
      spdlog::debug("Rejecting duplicate txid '{}'", tx.txid);
      return abort(commit_status::duplicate_txid);
    }
    if (detail::is_lock_failure(status)) {
      spdlog::warn("txid '{}' lock unavailable: {}", tx.txid,
                   status.ToString());
      return abort(commit_status::conflict);
    }
    if (!status.IsNotFound()) {
      spdlog::error("Failed to read txid index: {}", status.ToString());
      coffer::common::critical("Failed to read txid index from RocksDB");
    }

    auto id_bytes = make_bytes(bytes_view_t{tx.transaction_id});
    if (!put(txid_key, id_bytes) ||
        !put(key::make_transaction_key(tx.transaction_id),
             encoder.encode(tx)) ||
        !put(key::make_wallet_transaction_key(tx.wallet_id, tx.sequence),
             id_bytes)) {
      return abort(commit_status::conflict);
    }
  }

  for (const auto& tx : changes.updated_transactions) {
    if (!put(key::make_transaction_key(tx.transaction_id),
             encoder.encode(tx))) {
      return abort(commit_status::conflict);
    }
  }

  for (const auto& wallet : changes.wallets) {
    if (!put(key::make_wallet_key(wallet.wallet_id), encoder.encode(wallet))) {
      return abort(commit_status::conflict);
    }
  }

  auto status = txn->Commit();
  if (detail::is_lock_failure(status)) {
    spdlog::warn("RocksDB commit expired: {}", status.ToString());
    return commit_status::conflict;
  }
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB transaction: {}",
                  status.ToString());
    coffer::common::critical("Failed to commit RocksDB transaction");
  }
  return commit_status::committed;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  auto transaction_options = ROCKSDB_NAMESPACE::TransactionDBOptions{};

  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      options, transaction_options, std::string{path}, &database);
  if (!status.ok()) {
    coffer::common::critical("Failed to open RocksDB at {}: {}", path,
                             status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace coffer::storage
