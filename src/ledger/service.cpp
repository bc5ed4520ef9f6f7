#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <coffer/ledger/service.hpp>
#include <iterator>
#include <set>
#include <string>
#include <tuple>
#include <utility>

using namespace coffer::schema;

namespace {

std::string_view trim(const std::string_view value) {
  auto is_space = [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  auto first = std::find_if_not(std::begin(value), std::end(value), is_space);
  auto last =
      std::find_if_not(std::rbegin(value), std::rend(value), is_space).base();
  if (first >= last) {
    return {};
  }
  return std::string_view{&*first, static_cast<size_t>(last - first)};
}

std::optional<std::string> validate_label(const std::string_view label,
                                          const size_t max_length) {
  auto trimmed = trim(label);
  if (trimmed.empty() || trimmed.size() > max_length) {
    return std::nullopt;
  }
  return std::string{trimmed};
}

ledger_error_code to_error_code(const coffer::ledger::lock_status status) {
  return status == coffer::ledger::lock_status::cancelled
             ? ledger_error_code::cancelled
             : ledger_error_code::lock_timeout;
}

template <typename T>
ledger_result<T> lock_failure(const coffer::ledger::lock_status status,
                              const wallet_id_t& wallet_id) {
  auto code = to_error_code(status);
  if (code == ledger_error_code::cancelled) {
    spdlog::debug("Call on wallet {} cancelled before it was locked",
                  to_string(wallet_id));
    return make_failure<T>(code, "cancelled while waiting for wallet lock");
  }
  spdlog::warn("Timed out waiting for wallet {}", to_string(wallet_id));
  return make_failure<T>(code, "timed out waiting for wallet lock");
}

template <typename T>
ledger_result<T> wallet_not_found(const wallet_id_t& wallet_id) {
  return make_failure<T>(ledger_error_code::wallet_not_found,
                         "wallet " + to_string(wallet_id) + " not found");
}

template <typename T>
ledger_result<T> storage_conflict(const wallet_id_t& wallet_id) {
  spdlog::warn("Storage could not lock rows for wallet {}",
               to_string(wallet_id));
  return make_failure<T>(ledger_error_code::lock_timeout,
                         "storage row lock unavailable");
}

auto ordering_key(const wallet_state_t& wallet,
                  const wallet_ordering_t ordering) {
  switch (ordering) {
    case wallet_ordering_t::balance_ascending:
    case wallet_ordering_t::balance_descending:
      return std::tuple{wallet.balance.minor_units, uint64_t{}, std::string{}};
    case wallet_ordering_t::created_at_ascending:
    case wallet_ordering_t::created_at_descending:
      return std::tuple{int64_t{}, wallet.created_at, std::string{}};
    case wallet_ordering_t::updated_at_ascending:
    case wallet_ordering_t::updated_at_descending:
      return std::tuple{int64_t{}, wallet.updated_at, std::string{}};
    case wallet_ordering_t::label_ascending:
    case wallet_ordering_t::label_descending:
      return std::tuple{int64_t{}, uint64_t{}, wallet.label};
  }
  return std::tuple{int64_t{}, uint64_t{}, std::string{}};
}

bool is_descending(const wallet_ordering_t ordering) {
  switch (ordering) {
    case wallet_ordering_t::balance_descending:
    case wallet_ordering_t::created_at_descending:
    case wallet_ordering_t::updated_at_descending:
    case wallet_ordering_t::label_descending:
      return true;
    default:
      return false;
  }
}

}  // namespace

namespace coffer::ledger {

template <typename Library>
service<Library>::service(storage_t& storage,
                          wallet_lock_table& locks,
                          options settings)
    : storage_{storage}, locks_{locks}, options_{std::move(settings)} {
  if (!options_.clock) {
    options_.clock = &now_milliseconds;
  }
  spdlog::debug(
      "Ledger service ready (lock timeout {} ms, negative balances {})",
      options_.lock_timeout.count(),
      options_.allow_negative_balance ? "allowed" : "rejected");
}

template <typename Library>
wallet_lock_table::acquisition service<Library>::lock_wallet(
    const wallet_id_t& wallet_id,
    const call_options& call) {
  return locks_.acquire(wallet_id, call.lock_timeout.value_or(
                                       options_.lock_timeout),
                        call.stop_token);
}

template <typename Library>
ledger_result<wallet_state_t> service<Library>::create_wallet(
    const std::string_view label) {
  auto validated = validate_label(label, options_.max_label_length);
  if (!validated) {
    return make_failure<wallet_state_t>(ledger_error_code::invalid_label,
                                        "label must be 1 to " +
                                            std::to_string(
                                                options_.max_label_length) +
                                            " characters");
  }

  auto now = options_.clock();
  auto wallet = wallet_state_t{};
  wallet.wallet_id = make_uuid();
  wallet.label = std::move(*validated);
  wallet.created_at = now;
  wallet.updated_at = now;

  auto status = storage_.commit(coffer::storage::write_set{
      .wallets = {wallet}, .inserted_transactions = {},
      .updated_transactions = {}});
  if (status != coffer::storage::commit_status::committed) {
    return storage_conflict<wallet_state_t>(wallet.wallet_id);
  }
  spdlog::info("Created wallet {} '{}'", to_string(wallet.wallet_id),
               wallet.label);
  return make_success(std::move(wallet));
}

template <typename Library>
ledger_result<transaction_state_t> service<Library>::apply_transaction(
    const wallet_id_t& wallet_id,
    const std::string_view txid,
    const amount_t& amount,
    const call_options& call) {
  auto acquisition = lock_wallet(wallet_id, call);
  if (acquisition.status != lock_status::acquired) {
    return lock_failure<transaction_state_t>(acquisition.status, wallet_id);
  }

  auto wallet = storage_.load_wallet(wallet_id);
  if (!wallet) {
    return wallet_not_found<transaction_state_t>(wallet_id);
  }
  if (!wallet->active) {
    return make_failure<transaction_state_t>(
        ledger_error_code::wallet_inactive,
        "wallet " + to_string(wallet_id) + " is deactivated");
  }
  if (txid.empty() || txid.size() > options_.max_txid_length) {
    return make_failure<transaction_state_t>(
        ledger_error_code::invalid_transaction_id,
        "txid must be 1 to " + std::to_string(options_.max_txid_length) +
            " characters");
  }
  if (is_zero(amount)) {
    return make_failure<transaction_state_t>(ledger_error_code::invalid_amount,
                                             "amount must be non-zero");
  }

  auto balance = checked_add(wallet->balance, amount);
  if (!balance) {
    return make_failure<transaction_state_t>(
        ledger_error_code::balance_overflow,
        "balance would leave the representable range");
  }
  if (!options_.allow_negative_balance && is_negative(*balance)) {
    return make_failure<transaction_state_t>(
        ledger_error_code::insufficient_balance,
        "balance " + to_string(wallet->balance) + " cannot cover " +
            to_string(amount));
  }

  auto now = options_.clock();
  auto tx = transaction_state_t{};
  tx.transaction_id = make_uuid();
  tx.wallet_id = wallet_id;
  tx.txid = std::string{txid};
  tx.amount = amount;
  tx.created_at = now;
  tx.updated_at = now;
  tx.sequence = wallet->transaction_count;

  wallet->balance = *balance;
  wallet->updated_at = now;
  ++wallet->transaction_count;

  auto status = storage_.commit(coffer::storage::write_set{
      .wallets = {*wallet}, .inserted_transactions = {tx},
      .updated_transactions = {}});
  switch (status) {
    case coffer::storage::commit_status::committed:
      break;
    case coffer::storage::commit_status::duplicate_txid:
      spdlog::debug("txid '{}' already recorded; wallet {} unchanged", txid,
                    to_string(wallet_id));
      return make_failure<transaction_state_t>(
          ledger_error_code::duplicate_transaction_id,
          "txid '" + std::string{txid} + "' already exists");
    case coffer::storage::commit_status::conflict:
      return storage_conflict<transaction_state_t>(wallet_id);
  }

  spdlog::info("Applied {} txid '{}' ({}) to wallet {}, balance {}",
               is_credit(tx) ? "credit" : "debit", tx.txid,
               to_string(tx.amount), to_string(wallet_id),
               to_string(wallet->balance));
  return make_success(std::move(tx));
}

template <typename Library>
ledger_result<wallet_state_t> service<Library>::deactivate_wallet(
    const wallet_id_t& wallet_id,
    const call_options& call) {
  auto acquisition = lock_wallet(wallet_id, call);
  if (acquisition.status != lock_status::acquired) {
    return lock_failure<wallet_state_t>(acquisition.status, wallet_id);
  }

  auto wallet = storage_.load_wallet(wallet_id);
  if (!wallet) {
    return wallet_not_found<wallet_state_t>(wallet_id);
  }
  if (!wallet->active) {
    spdlog::debug("Wallet {} already deactivated", to_string(wallet_id));
    return make_success(std::move(*wallet));
  }

  auto now = options_.clock();
  wallet->active = false;
  wallet->deactivated_at = now;
  wallet->updated_at = now;

  auto changes = coffer::storage::write_set{};
  for (auto& tx : storage_.list_transactions_by_wallet(wallet_id)) {
    if (!tx.active) {
      continue;
    }
    tx.active = false;
    tx.deactivated_at = now;
    tx.updated_at = now;
    changes.updated_transactions.push_back(std::move(tx));
  }
  changes.wallets.push_back(*wallet);

  auto status = storage_.commit(changes);
  if (status != coffer::storage::commit_status::committed) {
    return storage_conflict<wallet_state_t>(wallet_id);
  }
  spdlog::info("Deactivated wallet {} and {} transaction(s)",
               to_string(wallet_id), changes.updated_transactions.size());
  return make_success(std::move(*wallet));
}

template <typename Library>
ledger_result<wallet_state_t> service<Library>::update_label(
    const wallet_id_t& wallet_id,
    const std::string_view label,
    const call_options& call) {
  auto acquisition = lock_wallet(wallet_id, call);
  if (acquisition.status != lock_status::acquired) {
    return lock_failure<wallet_state_t>(acquisition.status, wallet_id);
  }

  auto wallet = storage_.load_wallet(wallet_id);
  if (!wallet) {
    return wallet_not_found<wallet_state_t>(wallet_id);
  }
  auto validated = validate_label(label, options_.max_label_length);
  if (!validated) {
    return make_failure<wallet_state_t>(ledger_error_code::invalid_label,
                                        "label must be 1 to " +
                                            std::to_string(
                                                options_.max_label_length) +
                                            " characters");
  }

  wallet->label = std::move(*validated);
  wallet->updated_at = options_.clock();
  auto status = storage_.commit(coffer::storage::write_set{
      .wallets = {*wallet}, .inserted_transactions = {},
      .updated_transactions = {}});
  if (status != coffer::storage::commit_status::committed) {
    return storage_conflict<wallet_state_t>(wallet_id);
  }
  spdlog::info("Relabelled wallet {} to '{}'", to_string(wallet_id),
               wallet->label);
  return make_success(std::move(*wallet));
}

template <typename Library>
std::vector<transaction_state_t> service<Library>::search_transactions(
    const std::span<const wallet_id_t> wallet_ids) const {
  return storage_.list_transactions_by_wallets(wallet_ids);
}

template <typename Library>
ledger_result<wallet_state_t> service<Library>::get_wallet(
    const wallet_id_t& wallet_id) const {
  auto wallet = storage_.load_wallet(wallet_id);
  if (!wallet) {
    return wallet_not_found<wallet_state_t>(wallet_id);
  }
  return make_success(std::move(*wallet));
}

template <typename Library>
std::vector<wallet_state_t> service<Library>::list_wallets(
    const wallet_filter_t& filter) const {
  auto wanted = std::set<wallet_id_t>{std::begin(filter.wallet_ids),
                                      std::end(filter.wallet_ids)};
  auto wallets = storage_.list_wallets();
  std::erase_if(wallets, [&](const wallet_state_t& wallet) {
    if (filter.active && wallet.active != *filter.active) {
      return true;
    }
    return !wanted.empty() && !wanted.contains(wallet.wallet_id);
  });

  auto ordering = filter.ordering;
  auto descending = is_descending(ordering);
  // Ties fall back to creation time, then id, so listings are stable.
  std::sort(std::begin(wallets), std::end(wallets),
            [&](const wallet_state_t& lhs, const wallet_state_t& rhs) {
              auto lhs_key = ordering_key(lhs, ordering);
              auto rhs_key = ordering_key(rhs, ordering);
              if (lhs_key != rhs_key) {
                return descending ? rhs_key < lhs_key : lhs_key < rhs_key;
              }
              return std::tie(lhs.created_at, lhs.wallet_id) <
                     std::tie(rhs.created_at, rhs.wallet_id);
            });
  return wallets;
}

template <typename Library>
ledger_result<transaction_state_t> service<Library>::get_transaction(
    const std::string_view txid) const {
  auto tx = storage_.load_transaction_by_txid(txid);
  if (!tx) {
    return make_failure<transaction_state_t>(
        ledger_error_code::transaction_not_found,
        "txid '" + std::string{txid} + "' not found");
  }
  return make_success(std::move(*tx));
}

template class service<coffer::storage::rocksdb_storage_tag>;
template class service<coffer::storage::memory_storage_tag>;

}  // namespace coffer::ledger
