#pragma once
#include <coffer/common/critical.hpp>
#include <coffer/schema/encoding/encoder.hpp>
#include <scale/scale.hpp>

namespace coffer::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  coffer::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const coffer::schema::bytes_view_t& bytes);
};

template <typename T>
coffer::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    coffer::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const coffer::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace coffer::schema::encoding
