#include <coffer/schema/key/builder.hpp>
#include <coffer/schema/key/ledger_keys.hpp>

namespace coffer::schema::key {

coffer::schema::bytes_t make_wallet_key(const wallet_id_t& wallet_id) {
  auto b = builder{};
  b.write(kWalletKeyPrefix);
  b.write(wallet_id);
  return b.data;
}

coffer::schema::bytes_t make_transaction_key(
    const transaction_id_t& transaction_id) {
  auto b = builder{};
  b.write(kTransactionKeyPrefix);
  b.write(transaction_id);
  return b.data;
}

coffer::schema::bytes_t make_txid_key(const std::string_view txid) {
  auto b = builder{};
  b.write(kTxidIndexPrefix);
  b.write(txid);
  return b.data;
}

coffer::schema::bytes_t make_wallet_transaction_prefix(
    const wallet_id_t& wallet_id) {
  auto b = builder{};
  b.write(kWalletTransactionIndexPrefix);
  b.write(wallet_id);
  b.write("|");
  return b.data;
}

coffer::schema::bytes_t make_wallet_transaction_key(
    const wallet_id_t& wallet_id,
    const uint64_t sequence) {
  auto b = builder{};
  b.data = make_wallet_transaction_prefix(wallet_id);
  b.write(sequence);
  return b.data;
}

}  // namespace coffer::schema::key
