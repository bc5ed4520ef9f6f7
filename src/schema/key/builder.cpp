#include <algorithm>
#include <coffer/schema/key/builder.hpp>
#include <iterator>

using namespace coffer::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const coffer::schema::uuid_bytes_t& id) {
  std::ranges::copy(id, std::back_inserter(data));
  return *this;
}
