#pragma once

#include <coffer/schema/primitives.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>

namespace coffer::ledger {

enum class lock_status : uint8_t { acquired = 0, timed_out = 1, cancelled = 2 };

/// Keyed mutual exclusion over wallet ids. Holding the guard for a wallet
/// blocks every other acquisition of the same id; distinct ids never contend.
/// Entries exist only while a wallet is held or waited on.
class wallet_lock_table final {
 public:
  /// Scoped ownership of one wallet. Releases on destruction; movable so it
  /// can be returned out of `acquire`.
  class guard final {
   public:
    guard() = default;
    guard(guard&& other) noexcept;
    guard& operator=(guard&& other) noexcept;
    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;
    ~guard();

    bool owns_lock() const { return table_ != nullptr; }
    void release();

   private:
    friend class wallet_lock_table;
    guard(wallet_lock_table* table, const coffer::schema::wallet_id_t& id);

    wallet_lock_table* table_{nullptr};
    coffer::schema::wallet_id_t wallet_id_{};
  };

  struct acquisition final {
    lock_status status{lock_status::timed_out};
    guard lock;
  };

  wallet_lock_table() = default;
  wallet_lock_table(const wallet_lock_table&) = delete;
  wallet_lock_table& operator=(const wallet_lock_table&) = delete;

  /// Wait up to `timeout` for exclusive access to `wallet_id`. A stop request
  /// on `stop_token` ends the wait early with `lock_status::cancelled`; a stop
  /// already requested on entry never takes the lock.
  acquisition acquire(const coffer::schema::wallet_id_t& wallet_id,
                      std::chrono::milliseconds timeout,
                      std::stop_token stop_token = {});

  bool is_held(const coffer::schema::wallet_id_t& wallet_id) const;

  /// Number of wallets currently held or waited on.
  std::size_t size() const;

 private:
  struct entry final {
    bool held{false};
    std::size_t waiters{};
    std::condition_variable_any released;
  };

  void release(const coffer::schema::wallet_id_t& wallet_id);

  mutable std::mutex mutex_;
  std::map<coffer::schema::wallet_id_t, std::unique_ptr<entry>> entries_;
};

}  // namespace coffer::ledger
