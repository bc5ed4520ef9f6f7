#include <coffer/ledger/service.hpp>
#include <coffer/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <latch>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using coffer::schema::ledger_error_code;
using coffer::testing::make_amount;

namespace {

constexpr auto kThreads = 8;
constexpr auto kApplyPerThread = 25;

template <typename Library>
class ledger_concurrency : public ::testing::Test {
 protected:
  coffer::testing::ledger_fixture<Library> fixture{
      "coffer_concurrency",
      coffer::ledger::options{
          .lock_timeout = 30s,
          .max_label_length = coffer::ledger::kDefaultMaxLabelLength,
          .max_txid_length = coffer::ledger::kDefaultMaxTxidLength,
          .allow_negative_balance = false,
          .clock = &coffer::schema::now_milliseconds}};
};

using backends = ::testing::Types<coffer::storage::rocksdb_storage_tag,
                                  coffer::storage::memory_storage_tag>;
TYPED_TEST_SUITE(ledger_concurrency, backends);

int64_t sum_minor_units(
    const std::vector<coffer::schema::transaction_state_t>& transactions) {
  auto total = int64_t{};
  for (const auto& tx : transactions) {
    total += tx.amount.minor_units;
  }
  return total;
}

}  // namespace

TYPED_TEST(ledger_concurrency, balance_is_sum_of_interleaved_applies) {
  auto& ledger = this->fixture.service();
  auto wallet = this->fixture.create_wallet();
  auto start = std::latch{kThreads};
  auto failures = std::atomic<int>{0};

  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      start.arrive_and_wait();
      for (auto i = 0; i < kApplyPerThread; ++i) {
        // Alternate credits and smaller debits so order matters for any
        // lost update.
        auto amount = (i % 2 == 0) ? make_amount("3.00") : make_amount("-1.25");
        auto txid = "w" + std::to_string(t) + "-" + std::to_string(i);
        if (!ledger.apply_transaction(wallet.wallet_id, txid, amount).ok()) {
          ++failures;
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  ASSERT_EQ(failures.load(), 0);

  auto ids = std::vector<coffer::schema::wallet_id_t>{wallet.wallet_id};
  auto transactions = ledger.search_transactions(ids);
  ASSERT_EQ(transactions.size(),
            static_cast<size_t>(kThreads * kApplyPerThread));

  auto reloaded = this->fixture.reload(wallet.wallet_id);
  EXPECT_EQ(reloaded.balance.minor_units, sum_minor_units(transactions));
  // 13 credits of 3.00 and 12 debits of 1.25 per thread.
  EXPECT_EQ(reloaded.balance.minor_units, kThreads * (13 * 300 - 12 * 125));
  EXPECT_EQ(reloaded.transaction_count,
            static_cast<uint64_t>(kThreads * kApplyPerThread));

  auto sequences = std::set<uint64_t>{};
  for (const auto& tx : transactions) {
    sequences.insert(tx.sequence);
  }
  EXPECT_EQ(sequences.size(), transactions.size());
}

TYPED_TEST(ledger_concurrency, same_txid_on_one_wallet_has_one_winner) {
  auto& ledger = this->fixture.service();
  auto wallet = this->fixture.create_wallet();
  auto start = std::latch{kThreads};
  auto successes = std::atomic<int>{0};
  auto duplicates = std::atomic<int>{0};

  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&] {
      start.arrive_and_wait();
      auto result = ledger.apply_transaction(wallet.wallet_id, "contested",
                                             make_amount("10.00"));
      if (result.ok()) {
        ++successes;
      } else if (result.code == ledger_error_code::duplicate_transaction_id) {
        ++duplicates;
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(successes.load(), 1);
  EXPECT_EQ(duplicates.load(), kThreads - 1);
  EXPECT_EQ(this->fixture.reload(wallet.wallet_id).balance,
            make_amount("10.00"));
}

TYPED_TEST(ledger_concurrency, same_txid_across_wallets_has_one_winner) {
  auto& ledger = this->fixture.service();
  auto wallets = std::vector<coffer::schema::wallet_state_t>{};
  for (auto t = 0; t < kThreads; ++t) {
    wallets.push_back(this->fixture.create_wallet("w" + std::to_string(t)));
  }
  auto start = std::latch{kThreads};
  auto successes = std::atomic<int>{0};
  auto duplicates = std::atomic<int>{0};

  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      start.arrive_and_wait();
      auto result = ledger.apply_transaction(wallets[t].wallet_id, "global",
                                             make_amount("7.00"));
      if (result.ok()) {
        ++successes;
      } else if (result.code == ledger_error_code::duplicate_transaction_id) {
        ++duplicates;
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(successes.load(), 1);
  EXPECT_EQ(duplicates.load(), kThreads - 1);

  auto total = int64_t{};
  auto ids = std::vector<coffer::schema::wallet_id_t>{};
  for (const auto& wallet : wallets) {
    total += this->fixture.reload(wallet.wallet_id).balance.minor_units;
    ids.push_back(wallet.wallet_id);
  }
  EXPECT_EQ(total, make_amount("7.00").minor_units);
  EXPECT_EQ(ledger.search_transactions(ids).size(), 1u);
}

TYPED_TEST(ledger_concurrency, deactivation_racing_applies_is_all_or_nothing) {
  auto& ledger = this->fixture.service();
  auto wallet = this->fixture.create_wallet();
  auto start = std::latch{kThreads + 1};
  auto applied = std::atomic<int>{0};
  auto rejected = std::atomic<int>{0};
  auto unexpected = std::atomic<int>{0};

  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      start.arrive_and_wait();
      for (auto i = 0; i < kApplyPerThread; ++i) {
        auto txid = "r" + std::to_string(t) + "-" + std::to_string(i);
        auto result =
            ledger.apply_transaction(wallet.wallet_id, txid, make_amount("1"));
        if (result.ok()) {
          ++applied;
        } else if (result.code == ledger_error_code::wallet_inactive) {
          ++rejected;
        } else {
          ++unexpected;
        }
      }
    });
  }
  workers.emplace_back([&] {
    start.arrive_and_wait();
    std::this_thread::sleep_for(1ms);
    if (!ledger.deactivate_wallet(wallet.wallet_id).ok()) {
      ++unexpected;
    }
  });
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(unexpected.load(), 0);
  EXPECT_EQ(applied.load() + rejected.load(), kThreads * kApplyPerThread);

  auto reloaded = this->fixture.reload(wallet.wallet_id);
  ASSERT_FALSE(reloaded.active);
  auto ids = std::vector<coffer::schema::wallet_id_t>{wallet.wallet_id};
  auto transactions = ledger.search_transactions(ids);
  EXPECT_EQ(transactions.size(), static_cast<size_t>(applied.load()));
  EXPECT_EQ(reloaded.balance.minor_units, sum_minor_units(transactions));
  for (const auto& tx : transactions) {
    EXPECT_FALSE(tx.active) << tx.txid;
    EXPECT_EQ(tx.deactivated_at, reloaded.deactivated_at) << tx.txid;
  }
}

TYPED_TEST(ledger_concurrency, readers_never_see_partial_deactivation) {
  auto& ledger = this->fixture.service();
  auto wallet = this->fixture.create_wallet();
  for (auto i = 0; i < 40; ++i) {
    ASSERT_TRUE(ledger
                    .apply_transaction(wallet.wallet_id,
                                       "p" + std::to_string(i),
                                       make_amount("1"))
                    .ok());
  }

  auto done = std::atomic<bool>{false};
  auto mixed = std::atomic<int>{0};
  auto ids = std::vector<coffer::schema::wallet_id_t>{wallet.wallet_id};
  auto reader = std::thread{[&] {
    while (!done.load()) {
      auto rows = ledger.search_transactions(ids);
      auto active = std::count_if(
          std::begin(rows), std::end(rows),
          [](const coffer::schema::transaction_state_t& tx) {
            return tx.active;
          });
      if (active != 0 && active != static_cast<std::ptrdiff_t>(rows.size())) {
        ++mixed;
      }
    }
  }};

  std::this_thread::sleep_for(2ms);
  EXPECT_TRUE(ledger.deactivate_wallet(wallet.wallet_id).ok());
  std::this_thread::sleep_for(2ms);
  done = true;
  reader.join();
  EXPECT_EQ(mixed.load(), 0);
}
