#pragma once

#include <coffer/schema/amount.hpp>
#include <coffer/schema/primitives.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace coffer::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       coffer::schema::to_string(coffer::schema::make_uuid()));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary database directory, removed on destruction. Declare it before
/// the storage that uses it so the database closes first.
class scoped_db_path final {
 public:
  explicit scoped_db_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}
  scoped_db_path(const scoped_db_path&) = delete;
  scoped_db_path& operator=(const scoped_db_path&) = delete;
  ~scoped_db_path() { remove_path(path_); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

inline coffer::schema::amount_t make_amount(const std::string_view text) {
  auto parsed = coffer::schema::try_parse_amount(text);
  if (!parsed) {
    throw std::invalid_argument{"bad amount literal in test"};
  }
  return *parsed;
}

inline coffer::schema::wallet_id_t make_wallet_id(const uint8_t seed) {
  auto out = coffer::schema::wallet_id_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Clock that advances by `step` on every read, so each mutation gets a
/// distinct timestamp.
inline std::function<coffer::schema::timestamp_milliseconds_t()>
make_stepping_clock(const coffer::schema::timestamp_milliseconds_t start,
                    const coffer::schema::timestamp_milliseconds_t step = 1) {
  auto current =
      std::make_shared<std::atomic<coffer::schema::timestamp_milliseconds_t>>(
          start);
  return [current, step] { return current->fetch_add(step); };
}

}  // namespace coffer::testing
