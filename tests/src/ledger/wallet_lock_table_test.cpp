#include <coffer/ledger/wallet_lock_table.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

TEST(wallet_lock_table, acquire_and_release_cleans_up) {
  auto locks = coffer::ledger::wallet_lock_table{};
  auto wallet = coffer::testing::make_wallet_id(1);
  {
    auto acquisition = locks.acquire(wallet, 10ms);
    ASSERT_EQ(acquisition.status, coffer::ledger::lock_status::acquired);
    EXPECT_TRUE(acquisition.lock.owns_lock());
    EXPECT_TRUE(locks.is_held(wallet));
    EXPECT_EQ(locks.size(), 1u);
  }
  EXPECT_FALSE(locks.is_held(wallet));
  EXPECT_EQ(locks.size(), 0u);
}

TEST(wallet_lock_table, second_acquisition_times_out) {
  auto locks = coffer::ledger::wallet_lock_table{};
  auto wallet = coffer::testing::make_wallet_id(1);
  auto held = locks.acquire(wallet, 10ms);
  ASSERT_EQ(held.status, coffer::ledger::lock_status::acquired);

  auto started = std::chrono::steady_clock::now();
  auto blocked = locks.acquire(wallet, 30ms);
  EXPECT_EQ(blocked.status, coffer::ledger::lock_status::timed_out);
  EXPECT_FALSE(blocked.lock.owns_lock());
  EXPECT_GE(std::chrono::steady_clock::now() - started, 30ms);
  EXPECT_TRUE(locks.is_held(wallet));
}

TEST(wallet_lock_table, zero_timeout_fails_fast_when_held) {
  auto locks = coffer::ledger::wallet_lock_table{};
  auto wallet = coffer::testing::make_wallet_id(1);
  auto held = locks.acquire(wallet, 0ms);
  ASSERT_EQ(held.status, coffer::ledger::lock_status::acquired);
  EXPECT_EQ(locks.acquire(wallet, 0ms).status,
            coffer::ledger::lock_status::timed_out);
}

TEST(wallet_lock_table, distinct_wallets_do_not_contend) {
  auto locks = coffer::ledger::wallet_lock_table{};
  auto first = locks.acquire(coffer::testing::make_wallet_id(1), 0ms);
  auto second = locks.acquire(coffer::testing::make_wallet_id(2), 0ms);
  EXPECT_EQ(first.status, coffer::ledger::lock_status::acquired);
  EXPECT_EQ(second.status, coffer::ledger::lock_status::acquired);
  EXPECT_EQ(locks.size(), 2u);
}

TEST(wallet_lock_table, waiter_takes_over_after_release) {
  auto locks = coffer::ledger::wallet_lock_table{};
  auto wallet = coffer::testing::make_wallet_id(1);
  auto held = locks.acquire(wallet, 0ms);
  ASSERT_EQ(held.status, coffer::ledger::lock_status::acquired);

  auto waiter = std::async(std::launch::async, [&] {
    auto acquisition = locks.acquire(wallet, 5s);
    return acquisition.status;
  });
  std::this_thread::sleep_for(20ms);
  held.lock.release();

  EXPECT_EQ(waiter.get(), coffer::ledger::lock_status::acquired);
  EXPECT_EQ(locks.size(), 0u);
}

TEST(wallet_lock_table, stop_before_acquire_is_cancelled) {
  auto locks = coffer::ledger::wallet_lock_table{};
  auto source = std::stop_source{};
  source.request_stop();
  auto acquisition =
      locks.acquire(coffer::testing::make_wallet_id(1), 1s, source.get_token());
  EXPECT_EQ(acquisition.status, coffer::ledger::lock_status::cancelled);
  EXPECT_EQ(locks.size(), 0u);
}

TEST(wallet_lock_table, stop_interrupts_a_waiter) {
  auto locks = coffer::ledger::wallet_lock_table{};
  auto wallet = coffer::testing::make_wallet_id(1);
  auto held = locks.acquire(wallet, 0ms);
  ASSERT_EQ(held.status, coffer::ledger::lock_status::acquired);

  auto source = std::stop_source{};
  auto waiter = std::async(std::launch::async, [&] {
    return locks.acquire(wallet, 10s, source.get_token()).status;
  });
  std::this_thread::sleep_for(20ms);
  source.request_stop();

  EXPECT_EQ(waiter.wait_for(5s), std::future_status::ready);
  EXPECT_EQ(waiter.get(), coffer::ledger::lock_status::cancelled);
  EXPECT_TRUE(locks.is_held(wallet));
}

TEST(wallet_lock_table, guard_moves_ownership) {
  auto locks = coffer::ledger::wallet_lock_table{};
  auto wallet = coffer::testing::make_wallet_id(1);
  auto acquisition = locks.acquire(wallet, 0ms);
  auto moved = std::move(acquisition.lock);
  EXPECT_FALSE(acquisition.lock.owns_lock());
  EXPECT_TRUE(moved.owns_lock());

  auto other = coffer::ledger::wallet_lock_table::guard{};
  other = std::move(moved);
  EXPECT_TRUE(locks.is_held(wallet));
  other.release();
  EXPECT_FALSE(locks.is_held(wallet));
  other.release();
}

TEST(wallet_lock_table, holders_are_mutually_exclusive) {
  auto locks = coffer::ledger::wallet_lock_table{};
  auto wallet = coffer::testing::make_wallet_id(1);
  auto inside = std::atomic<int>{0};
  auto overlaps = std::atomic<int>{0};

  auto workers = std::vector<std::thread>{};
  for (auto i = 0; i < 8; ++i) {
    workers.emplace_back([&] {
      for (auto round = 0; round < 50; ++round) {
        auto acquisition = locks.acquire(wallet, 10s);
        if (acquisition.status != coffer::ledger::lock_status::acquired) {
          continue;
        }
        if (inside.fetch_add(1) != 0) {
          ++overlaps;
        }
        std::this_thread::yield();
        inside.fetch_sub(1);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  EXPECT_EQ(overlaps.load(), 0);
  EXPECT_EQ(locks.size(), 0u);
}
