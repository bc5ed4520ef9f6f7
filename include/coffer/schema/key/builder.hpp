#pragma once
#include <boost/endian/conversion.hpp>
#include <coffer/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace coffer::schema::key {

/// Byte-string key writer. Integers are written big-endian so that the
/// storage backend's lexicographic key order matches numeric order.
struct builder final {
  coffer::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const uuid_bytes_t& id);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace coffer::schema::key
