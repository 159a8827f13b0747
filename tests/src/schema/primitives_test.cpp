#include <gtest/gtest.h>
#include <provenance/schema/primitives.hpp>

TEST(primitives, try_make_hash32_requires_exactly_32_bytes) {
  auto exact = provenance::schema::bytes_t(32, 0xAB);
  auto hash = provenance::schema::try_make_hash32(exact);
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0xAB);
  EXPECT_EQ((*hash)[31], 0xAB);

  auto short_input = provenance::schema::bytes_t(31, 0xAB);
  EXPECT_FALSE(provenance::schema::try_make_hash32(short_input).has_value());
  auto long_input = provenance::schema::bytes_t(33, 0xAB);
  EXPECT_FALSE(provenance::schema::try_make_hash32(long_input).has_value());
}

TEST(primitives, hash32_from_hex_accepts_prefixed_input) {
  auto hash = provenance::schema::try_hash32_from_hex(
      "0x0102030405060708090a0b0c0d0e0f10"
      "1112131415161718191a1b1c1d1e1f20");
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
}

TEST(primitives, hash32_from_hex_rejects_wrong_length) {
  EXPECT_FALSE(provenance::schema::try_hash32_from_hex("0102").has_value());
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = provenance::schema::bytes_t{0x00, 0x01, 0x7F, 0xFE, 0xFF};
  auto encoded =
      provenance::schema::to_hex(provenance::schema::make_bytes_view(payload));
  EXPECT_EQ(encoded, "00017ffeff");
  EXPECT_EQ(provenance::schema::from_hex(encoded), payload);
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(provenance::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(provenance::schema::try_from_hex("zz").has_value());
}

