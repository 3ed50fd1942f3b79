#include <gtest/gtest.h>
#include <keystone/schema/encoding/fixed/encoder.hpp>
#include <keystone/testing/common.hpp>

#include <algorithm>
#include <limits>

namespace {

using encoder_t = keystone::schema::encoding::encoder<
    keystone::schema::encoding::fixed_layout_encoder_tag>;

keystone::schema::state_record_t make_record() {
  auto record = keystone::schema::state_record_t{};
  record.is_initialized = true;
  record.owner = keystone::testing::make_key(1);
  record.lifecycle_state = keystone::schema::lifecycle_state_t::updated;
  record.payload = keystone::testing::make_key(0x40);
  record.update_count = 0x01020304;
  return record;
}

}  // namespace

TEST(state_record_codec, encodes_fixed_offsets) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(make_record());

  ASSERT_EQ(bytes.size(), 70u);
  EXPECT_EQ(bytes[0], 0x01);
  EXPECT_EQ(bytes[1], 0x01);
  EXPECT_EQ(bytes[32], 0x20);
  EXPECT_EQ(bytes[33], 0x02);
  EXPECT_EQ(bytes[34], 0x40);
  EXPECT_EQ(bytes[65], 0x5F);
  // update_count is little-endian
  EXPECT_EQ(bytes[66], 0x04);
  EXPECT_EQ(bytes[67], 0x03);
  EXPECT_EQ(bytes[68], 0x02);
  EXPECT_EQ(bytes[69], 0x01);
}

TEST(state_record_codec, decode_inverts_encode) {
  auto encoder = encoder_t{};
  auto record = make_record();
  record.update_count = std::numeric_limits<uint32_t>::max();
  auto bytes = encoder.encode(record);
  auto decoded = encoder.try_decode<keystone::schema::state_record_t>(
      keystone::schema::make_bytes_view(bytes));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, record);
}

TEST(state_record_codec, zero_filled_account_reads_as_uninitialized) {
  auto encoder = encoder_t{};
  auto zeros = keystone::schema::bytes_t(70, 0x00);
  auto decoded = encoder.try_decode<keystone::schema::state_record_t>(
      keystone::schema::make_bytes_view(zeros));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_FALSE(decoded->is_initialized);
  EXPECT_EQ(decoded->lifecycle_state,
            keystone::schema::lifecycle_state_t::uninitialized);
  EXPECT_EQ(decoded->update_count, 0u);
}

TEST(state_record_codec, rejects_wrong_lengths) {
  auto encoder = encoder_t{};
  for (auto size : {0u, 1u, 69u, 71u, 140u}) {
    auto bytes = keystone::schema::bytes_t(size, 0x00);
    EXPECT_FALSE(encoder
                     .try_decode<keystone::schema::state_record_t>(
                         keystone::schema::make_bytes_view(bytes))
                     .has_value())
        << "size " << size;
  }
}

TEST(state_record_codec, rejects_unknown_lifecycle_state) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(make_record());
  for (auto raw : {3, 4, 0x7F, 0xFF}) {
    bytes[33] = static_cast<uint8_t>(raw);
    EXPECT_FALSE(encoder
                     .try_decode<keystone::schema::state_record_t>(
                         keystone::schema::make_bytes_view(bytes))
                     .has_value())
        << "lifecycle byte " << raw;
  }
}

TEST(state_record_codec, rejects_non_boolean_flag) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(make_record());
  bytes[0] = 0x02;
  EXPECT_FALSE(encoder
                   .try_decode<keystone::schema::state_record_t>(
                       keystone::schema::make_bytes_view(bytes))
                   .has_value());
}

TEST(state_record_codec, encode_into_checks_capacity_before_writing) {
  auto encoder = encoder_t{};
  auto region = keystone::schema::bytes_t(69, 0xEE);
  auto result = encoder.encode_into(
      make_record(),
      keystone::schema::mutable_bytes_view_t{region.data(), region.size()});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(*result.error, keystone::schema::program_error::write_overflow);
  EXPECT_TRUE(std::all_of(std::begin(region), std::end(region),
                          [](auto byte) { return byte == 0xEE; }));
}
