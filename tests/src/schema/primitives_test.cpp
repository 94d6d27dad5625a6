#include <gtest/gtest.h>
#include <wormhole/schema/primitives.hpp>

TEST(primitives, to_hex_is_lowercase_without_prefix) {
  auto bytes = wormhole::schema::bytes_t{0x00, 0x2A, 0xAB, 0xFF};
  EXPECT_EQ(wormhole::schema::to_hex(bytes), "002aabff");
  EXPECT_EQ(wormhole::schema::to_hex(wormhole::schema::bytes_t{}), "");
}

TEST(primitives, try_from_hex_accepts_prefix_and_mixed_case) {
  auto expected = wormhole::schema::bytes_t{0x12, 0xAB};
  EXPECT_EQ(wormhole::schema::try_from_hex("12ab"), expected);
  EXPECT_EQ(wormhole::schema::try_from_hex("0x12AB"), expected);
  EXPECT_EQ(wormhole::schema::try_from_hex("0X12aB"), expected);
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(wormhole::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(wormhole::schema::try_from_hex("zz").has_value());
  EXPECT_FALSE(wormhole::schema::try_from_hex("0x0g").has_value());
}
