#pragma once

#include <array>
#include <coffer/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: ledger keys.
// Canonical key prefixes and key codecs for wallet records, transaction
// records and the two transaction indexes (by txid, by wallet).
namespace coffer::schema::key {

inline constexpr std::string_view kWalletKeyPrefix{"SYS|STATE|WALLET|"};
inline constexpr std::string_view kTransactionKeyPrefix{"SYS|STATE|TX|"};
inline constexpr std::string_view kTxidIndexPrefix{"SYS|INDEX|TXID|"};
inline constexpr std::string_view kWalletTransactionIndexPrefix{
    "SYS|INDEX|WALLET_TX|"};

inline constexpr std::array<std::string_view, 4> kLedgerKeyspaces{
    kWalletKeyPrefix, kTransactionKeyPrefix, kTxidIndexPrefix,
    kWalletTransactionIndexPrefix};

coffer::schema::bytes_t make_wallet_key(const wallet_id_t& wallet_id);

coffer::schema::bytes_t make_transaction_key(
    const transaction_id_t& transaction_id);

/// Unique index: one entry per txid, value is the transaction id.
coffer::schema::bytes_t make_txid_key(std::string_view txid);

/// Prefix covering every index entry of one wallet.
coffer::schema::bytes_t make_wallet_transaction_prefix(
    const wallet_id_t& wallet_id);

/// Index entry ordered by the wallet-local sequence, value is the
/// transaction id.
coffer::schema::bytes_t make_wallet_transaction_key(
    const wallet_id_t& wallet_id,
    uint64_t sequence);

}  // namespace coffer::schema::key
