#pragma once
#include <coffer/schema/primitives.hpp>
#include <optional>
#include <span>

namespace coffer::schema::encoding {

// The codec is chosen at build time by tag, the same way storage backends
// are. Record structs stay plain aggregates so any codec that decomposes
// aggregates can serialize them without per-type glue.
template <typename Library>
struct encoder {
  template <typename T>
  coffer::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const coffer::schema::bytes_view_t& bytes);
};

}  // namespace coffer::schema::encoding
