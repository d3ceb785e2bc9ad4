#include <gtest/gtest.h>
#include <raceswap/schema/account_encoding.hpp>
#include <raceswap/schema/authority_mode.hpp>
#include <raceswap/schema/primitives.hpp>

TEST(primitives, zero_pubkey_is_all_ones_in_base58) {
  auto zero = raceswap::schema::make_zero_pubkey();
  EXPECT_EQ(raceswap::schema::to_string(zero),
            "11111111111111111111111111111111");
  EXPECT_EQ(raceswap::schema::make_pubkey("11111111111111111111111111111111"),
            zero);
}

TEST(primitives, base58_round_trips_program_ids) {
  constexpr auto kAggregator = "JUP6LkbZbjS1jKKwapdHNy74zcZ3tLUZoi5QNyVTaV4";
  auto key = raceswap::schema::make_pubkey(kAggregator);
  EXPECT_EQ(raceswap::schema::to_string(key), kAggregator);
}

TEST(primitives, base58_keeps_leading_zero_bytes) {
  auto payload = raceswap::schema::bytes_t{0x00, 0x00, 0x01, 0x02};
  auto encoded = raceswap::schema::to_base58(payload);
  EXPECT_EQ(encoded.substr(0, 2), "11");
  auto decoded = raceswap::schema::try_from_base58(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, payload);
}

TEST(primitives, try_make_pubkey_rejects_bad_input) {
  EXPECT_FALSE(raceswap::schema::try_make_pubkey("not-base58-0OIl").has_value());
  // Valid base58, wrong length.
  EXPECT_FALSE(raceswap::schema::try_make_pubkey("2g").has_value());
}

TEST(primitives, hex_round_trips_and_accepts_prefix) {
  auto bytes = raceswap::schema::from_hex("0x00ff10");
  EXPECT_EQ(bytes, (raceswap::schema::bytes_t{0x00, 0xff, 0x10}));
  EXPECT_EQ(raceswap::schema::to_hex(bytes), "00ff10");
  EXPECT_FALSE(raceswap::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(raceswap::schema::try_from_hex("zz").has_value());
}

TEST(enum_string, names_parse_and_list) {
  using raceswap::schema::account_encoding_t;
  using raceswap::schema::authority_mode_t;
  EXPECT_EQ(raceswap::schema::try_from_string<account_encoding_t>("indexed"),
            account_encoding_t::indexed);
  EXPECT_FALSE(
      raceswap::schema::try_from_string<account_encoding_t>("Indexed"));
  EXPECT_EQ(raceswap::schema::try_from_string<authority_mode_t>("direct"),
            authority_mode_t::direct);
  EXPECT_EQ(raceswap::schema::to_string(authority_mode_t::derived),
            "derived");
  EXPECT_EQ(raceswap::schema::join_names(
                raceswap::schema::kAccountEncodingMappings),
            "full|indexed");
  EXPECT_EQ(raceswap::schema::join_names(
                raceswap::schema::kAuthorityModeMappings, ", "),
            "direct, derived");
}
