#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <coffer/common/critical.hpp>
#include <coffer/schema/primitives.hpp>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>

namespace coffer::schema {

namespace {

boost::uuids::uuid to_boost_uuid(const uuid_bytes_t& id) {
  auto out = boost::uuids::uuid{};
  std::copy(std::begin(id), std::end(id), out.begin());
  return out;
}

uuid_bytes_t from_boost_uuid(const boost::uuids::uuid& id) {
  auto out = uuid_bytes_t{};
  std::copy(id.begin(), id.end(), std::begin(out));
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

uuid_bytes_t make_uuid() {
  // boost::uuids::random_generator is not safe to share between threads.
  thread_local auto generator = boost::uuids::random_generator{};
  return from_boost_uuid(generator());
}

std::string to_string(const uuid_bytes_t& id) {
  return boost::uuids::to_string(to_boost_uuid(id));
}

std::optional<uuid_bytes_t> try_make_uuid(const std::string_view& text) {
  if (text.size() != 36) {
    return std::nullopt;
  }
  try {
    auto parsed = boost::uuids::string_generator{}(std::begin(text),
                                                   std::end(text));
    return from_boost_uuid(parsed);
  } catch (const std::runtime_error&) {
    return std::nullopt;
  }
}

uuid_bytes_t make_uuid(const std::string_view& text) {
  auto parsed = try_make_uuid(text);
  if (!parsed) {
    coffer::common::critical("make_uuid expected a canonical uuid string");
  }
  return *parsed;
}

uuid_bytes_t make_uuid(const bytes_view_t& bytes) {
  if (bytes.size() != 16) {
    coffer::common::critical("make_uuid expected exactly 16 bytes");
  }
  auto id = uuid_bytes_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(id));
  return id;
}

timestamp_milliseconds_t now_milliseconds() {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch)
          .count());
}

}  // namespace coffer::schema
