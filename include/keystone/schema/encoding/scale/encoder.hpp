#pragma once
#include <keystone/common/critical.hpp>
#include <keystone/schema/encoding/encoder.hpp>
#include <scale/scale.hpp>

namespace keystone::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec for host-side values (ledger accounts and keys).
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  keystone::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const keystone::schema::bytes_view_t& bytes);
};

template <typename T>
keystone::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    keystone::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const keystone::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace keystone::schema::encoding
