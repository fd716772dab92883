#include <gtest/gtest.h>
#include <strongroom/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = strongroom::schema::bytes_t(32, 0xAB);
  auto hash = strongroom::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = strongroom::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  EXPECT_FALSE(strongroom::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(strongroom::schema::try_make_hash32("zz").has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = strongroom::schema::make_zero_hash();
  EXPECT_TRUE(strongroom::schema::is_zero(zero));
  zero[7] = 1;
  EXPECT_FALSE(strongroom::schema::is_zero(zero));
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = strongroom::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = strongroom::schema::to_hex(payload);
  EXPECT_EQ(encoded, "010203feff");
  EXPECT_EQ(strongroom::schema::from_hex(encoded), payload);
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(strongroom::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(strongroom::schema::try_from_hex("0xgg").has_value());
}
