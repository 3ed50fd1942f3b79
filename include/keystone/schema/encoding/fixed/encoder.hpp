#pragma once
#include <keystone/schema/encoding/encoder.hpp>
#include <keystone/schema/program_result.hpp>
#include <keystone/schema/state_record.hpp>

namespace keystone::schema::encoding {

struct fixed_layout_encoder_tag {};

/// Hand-written fixed-offset codec for records stored in account data.
///
/// Pure: it reads and writes only the buffers it is given.
template <>
struct encoder<fixed_layout_encoder_tag> final {
  /// Encode into a freshly allocated buffer of exactly the record size.
  template <typename T>
  keystone::schema::bytes_t encode(const T& obj);

  /// Encode into an existing writable region.
  ///
  /// Fails with `write_overflow` when the region size differs from the record
  /// size; the region is not touched in that case.
  template <typename T>
  keystone::schema::program_result encode_into(
      const T& obj,
      keystone::schema::mutable_bytes_view_t out);

  /// Decode, or std::nullopt when the length or any enumerated byte is
  /// invalid.
  template <typename T>
  std::optional<T> try_decode(const keystone::schema::bytes_view_t& bytes);
};

template <>
keystone::schema::bytes_t
encoder<fixed_layout_encoder_tag>::encode<keystone::schema::state_record_t>(
    const keystone::schema::state_record_t& obj);

template <>
keystone::schema::program_result
encoder<fixed_layout_encoder_tag>::encode_into<keystone::schema::state_record_t>(
    const keystone::schema::state_record_t& obj,
    keystone::schema::mutable_bytes_view_t out);

template <>
std::optional<keystone::schema::state_record_t>
encoder<fixed_layout_encoder_tag>::try_decode<keystone::schema::state_record_t>(
    const keystone::schema::bytes_view_t& bytes);

}  // namespace keystone::schema::encoding
