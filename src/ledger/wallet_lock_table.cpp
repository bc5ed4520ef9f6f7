#include <spdlog/spdlog.h>
#include <coffer/ledger/wallet_lock_table.hpp>

#include <utility>

using namespace coffer::schema;

namespace coffer::ledger {

wallet_lock_table::guard::guard(wallet_lock_table* table,
                                const wallet_id_t& id)
    : table_{table}, wallet_id_{id} {}

wallet_lock_table::guard::guard(guard&& other) noexcept
    : table_{std::exchange(other.table_, nullptr)},
      wallet_id_{other.wallet_id_} {}

wallet_lock_table::guard& wallet_lock_table::guard::operator=(
    guard&& other) noexcept {
  if (this != &other) {
    release();
    table_ = std::exchange(other.table_, nullptr);
    wallet_id_ = other.wallet_id_;
  }
  return *this;
}

wallet_lock_table::guard::~guard() {
  release();
}

void wallet_lock_table::guard::release() {
  if (auto* table = std::exchange(table_, nullptr)) {
    table->release(wallet_id_);
  }
}

wallet_lock_table::acquisition wallet_lock_table::acquire(
    const wallet_id_t& wallet_id,
    const std::chrono::milliseconds timeout,
    std::stop_token stop_token) {
  auto lock = std::unique_lock{mutex_};
  if (stop_token.stop_requested()) {
    return acquisition{.status = lock_status::cancelled, .lock = {}};
  }

  auto& slot = entries_[wallet_id];
  if (!slot) {
    slot = std::make_unique<entry>();
  }
  auto* current = slot.get();
  if (!current->held) {
    current->held = true;
    return acquisition{.status = lock_status::acquired,
                       .lock = guard{this, wallet_id}};
  }

  ++current->waiters;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto granted = current->released.wait_until(
      lock, stop_token, deadline, [current] { return !current->held; });
  --current->waiters;

  if (granted) {
    current->held = true;
    return acquisition{.status = lock_status::acquired,
                       .lock = guard{this, wallet_id}};
  }

  // The holder still owns the entry, so it is never erased here.
  auto status = stop_token.stop_requested() ? lock_status::cancelled
                                            : lock_status::timed_out;
  spdlog::debug("Gave up waiting for wallet {} ({})", to_string(wallet_id),
                status == lock_status::cancelled ? "cancelled" : "timed out");
  return acquisition{.status = status, .lock = {}};
}

bool wallet_lock_table::is_held(const wallet_id_t& wallet_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = entries_.find(wallet_id);
  return found != std::end(entries_) && found->second->held;
}

std::size_t wallet_lock_table::size() const {
  auto lock = std::scoped_lock{mutex_};
  return entries_.size();
}

void wallet_lock_table::release(const wallet_id_t& wallet_id) {
  auto lock = std::scoped_lock{mutex_};
  auto found = entries_.find(wallet_id);
  if (found == std::end(entries_)) {
    return;
  }
  found->second->held = false;
  if (found->second->waiters == 0) {
    entries_.erase(found);
    return;
  }
  found->second->released.notify_one();
}

}  // namespace coffer::ledger
