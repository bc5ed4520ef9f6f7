#include <gtest/gtest.h>
#include <coffer/schema/key/builder.hpp>
#include <coffer/schema/key/ledger_keys.hpp>
#include <coffer/schema/primitives.hpp>

#include <algorithm>
#include <string>
#include <string_view>

TEST(primitives, make_uuid_is_random) {
  auto first = coffer::schema::make_uuid();
  auto second = coffer::schema::make_uuid();
  EXPECT_NE(first, second);
}

TEST(primitives, uuid_string_round_trips) {
  auto id = coffer::schema::make_uuid();
  auto text = coffer::schema::to_string(id);
  EXPECT_EQ(text.size(), 36u);
  EXPECT_EQ(text[8], '-');
  EXPECT_EQ(coffer::schema::make_uuid(std::string_view{text}), id);
}

TEST(primitives, try_make_uuid_rejects_malformed_text) {
  EXPECT_FALSE(coffer::schema::try_make_uuid("").has_value());
  EXPECT_FALSE(coffer::schema::try_make_uuid("not-a-uuid").has_value());
  EXPECT_FALSE(
      coffer::schema::try_make_uuid("zzzzzzzz-zzzz-zzzz-zzzz-zzzzzzzzzzzz")
          .has_value());
  EXPECT_TRUE(
      coffer::schema::try_make_uuid("0e5b8f52-9a6c-4d8e-8f0a-1b2c3d4e5f60")
          .has_value());
}

TEST(primitives, make_uuid_from_bytes_copies_all_sixteen) {
  auto raw = coffer::schema::bytes_t(16, 0x5A);
  raw[15] = 0x01;
  auto id = coffer::schema::make_uuid(coffer::schema::make_bytes_view(raw));
  EXPECT_EQ(id[0], 0x5A);
  EXPECT_EQ(id[15], 0x01);
}

TEST(primitives, to_hex_renders_lowercase) {
  auto bytes = coffer::schema::bytes_t{0x00, 0xAB, 0xFF};
  EXPECT_EQ(coffer::schema::to_hex(coffer::schema::make_bytes_view(bytes)),
            "00abff");
}

TEST(key_builder, integers_are_written_big_endian) {
  auto builder = coffer::schema::key::builder{};
  builder.write(uint32_t{0x01020304});
  ASSERT_EQ(builder.data.size(), 4u);
  EXPECT_EQ(builder.data[0], 0x01);
  EXPECT_EQ(builder.data[3], 0x04);
}

TEST(ledger_keys, wallet_transaction_keys_sort_by_sequence) {
  auto wallet = coffer::schema::make_uuid();
  auto low = coffer::schema::key::make_wallet_transaction_key(wallet, 1);
  auto high = coffer::schema::key::make_wallet_transaction_key(wallet, 256);
  EXPECT_TRUE(std::lexicographical_compare(std::begin(low), std::end(low),
                                           std::begin(high), std::end(high)));

  auto prefix = coffer::schema::key::make_wallet_transaction_prefix(wallet);
  ASSERT_LT(prefix.size(), low.size());
  EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix), std::begin(low)));
}

TEST(ledger_keys, keys_live_in_their_keyspace) {
  auto id = coffer::schema::make_uuid();
  auto wallet_key = coffer::schema::key::make_wallet_key(id);
  auto tx_key = coffer::schema::key::make_transaction_key(id);
  auto txid_key = coffer::schema::key::make_txid_key("t1");

  EXPECT_TRUE(coffer::schema::make_string_view(wallet_key)
                  .starts_with(coffer::schema::key::kWalletKeyPrefix));
  EXPECT_TRUE(coffer::schema::make_string_view(tx_key)
                  .starts_with(coffer::schema::key::kTransactionKeyPrefix));
  EXPECT_TRUE(coffer::schema::make_string_view(txid_key)
                  .starts_with(coffer::schema::key::kTxidIndexPrefix));
  EXPECT_TRUE(coffer::schema::make_string_view(txid_key).ends_with("t1"));
}
