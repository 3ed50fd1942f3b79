#include <gtest/gtest.h>
#include <keystone/schema/ids.hpp>
#include <keystone/schema/primitives.hpp>

#include <string_view>

using namespace std::string_view_literals;

TEST(primitives, base58_encodes_reference_text) {
  auto encoded = keystone::schema::to_base58(keystone::schema::make_bytes_view(
      "The quick brown fox jumps over the lazy dog"sv));
  EXPECT_EQ(encoded,
            "7DdiPPYtxLjCD3wA1po2rvZHTDYjkZYiEtazrfiwJcwnKCizhGFhBGHeRdx");
}

TEST(primitives, base58_keeps_leading_zero_bytes) {
  EXPECT_EQ(keystone::schema::to_base58(keystone::schema::kSystemProgramId),
            "11111111111111111111111111111111");

  auto decoded = keystone::schema::try_from_base58("11111111111111111111111111111111");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->size(), 32u);
}

TEST(primitives, base58_decodes_well_known_ids) {
  EXPECT_EQ(keystone::schema::try_make_pubkey(
                "SysvarRent111111111111111111111111111111111"sv),
            keystone::schema::kRentSysvarId);
  EXPECT_EQ(keystone::schema::try_make_pubkey(
                "4ipgdgYdX1oK2n3GgeMh43rPdrrhb4kbDyAmNTSF93JE"sv),
            keystone::schema::kProgramId);
  EXPECT_EQ(keystone::schema::to_base58(keystone::schema::kSysvarOwnerId),
            "Sysvar1111111111111111111111111111111111111");
}

TEST(primitives, base58_rejects_characters_outside_alphabet) {
  EXPECT_FALSE(keystone::schema::try_from_base58(
                   "0DdiPPYtxLjCD3wA1po2rvZHTDYjkZYiEtazrfiwJcwnKCizhGFhBGHeRdx")
                   .has_value());
  EXPECT_FALSE(keystone::schema::try_from_base58("abc l").has_value());
}

TEST(primitives, try_make_pubkey_requires_32_bytes) {
  EXPECT_FALSE(keystone::schema::try_make_pubkey("2g"sv).has_value());
  auto short_bytes = keystone::schema::bytes_t(31, 0x01);
  EXPECT_FALSE(keystone::schema::try_make_pubkey(
                   keystone::schema::make_bytes_view(short_bytes))
                   .has_value());
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = keystone::schema::bytes_t{0x00, 0x01, 0xAB, 0xFF};
  auto encoded = keystone::schema::to_hex(payload);
  EXPECT_EQ(encoded, "0001abff");
  EXPECT_EQ(keystone::schema::from_hex("0x0001ABFF"), payload);
  EXPECT_FALSE(keystone::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(keystone::schema::try_from_hex("zz").has_value());
}
