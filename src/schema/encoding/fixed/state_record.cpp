#include <boost/endian/conversion.hpp>
#include <keystone/common/critical.hpp>
#include <keystone/schema/encoding/fixed/encoder.hpp>

#include <algorithm>
#include <iterator>
#include <string>

using namespace keystone::schema;

namespace keystone::schema::encoding {

namespace layout = keystone::schema::state_record_layout;

template <>
program_result encoder<fixed_layout_encoder_tag>::encode_into<state_record_t>(
    const state_record_t& obj,
    mutable_bytes_view_t out) {
  if (out.size() != layout::kSize) {
    return make_failure(program_error::write_overflow,
                        "state record needs " + std::to_string(layout::kSize) +
                            " bytes, region holds " +
                            std::to_string(out.size()));
  }

  out[layout::kIsInitializedOffset] = obj.is_initialized ? 1 : 0;
  std::copy(std::begin(obj.owner), std::end(obj.owner),
            std::begin(out) + layout::kOwnerOffset);
  out[layout::kLifecycleStateOffset] =
      static_cast<uint8_t>(obj.lifecycle_state);
  std::copy(std::begin(obj.payload), std::end(obj.payload),
            std::begin(out) + layout::kPayloadOffset);
  boost::endian::store_little_u32(out.data() + layout::kUpdateCountOffset,
                                  obj.update_count);
  return make_success();
}

template <>
bytes_t encoder<fixed_layout_encoder_tag>::encode<state_record_t>(
    const state_record_t& obj) {
  auto out = bytes_t(layout::kSize);
  auto written = encode_into(obj, mutable_bytes_view_t{out.data(), out.size()});
  if (!written.ok()) {
    keystone::common::critical(written.log);
  }
  return out;
}

template <>
std::optional<state_record_t>
encoder<fixed_layout_encoder_tag>::try_decode<state_record_t>(
    const bytes_view_t& bytes) {
  if (bytes.size() != layout::kSize) {
    return std::nullopt;
  }

  auto flag = bytes[layout::kIsInitializedOffset];
  if (flag > 1) {
    return std::nullopt;
  }
  auto lifecycle_state =
      try_make_lifecycle_state(bytes[layout::kLifecycleStateOffset]);
  if (!lifecycle_state) {
    return std::nullopt;
  }

  auto record = state_record_t{};
  record.is_initialized = flag == 1;
  std::copy_n(std::begin(bytes) + layout::kOwnerOffset, record.owner.size(),
              std::begin(record.owner));
  record.lifecycle_state = *lifecycle_state;
  std::copy_n(std::begin(bytes) + layout::kPayloadOffset, record.payload.size(),
              std::begin(record.payload));
  record.update_count =
      boost::endian::load_little_u32(bytes.data() + layout::kUpdateCountOffset);
  return record;
}

}  // namespace keystone::schema::encoding
