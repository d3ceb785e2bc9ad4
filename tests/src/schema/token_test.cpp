#include <gtest/gtest.h>
#include <raceswap/schema/token/mint.hpp>
#include <raceswap/schema/token/token_account.hpp>
#include <raceswap/testing/common.hpp>

using raceswap::testing::make_hash;

TEST(token, mint_decimals_come_from_the_structured_record) {
  auto mint = raceswap::schema::token::mint_t{
      .mint_authority = make_hash(1),
      .supply = 5'000,
      .decimals = 6,
      .is_initialized = true};
  auto data = raceswap::schema::token::encode_mint(mint);
  ASSERT_EQ(data.size(), raceswap::schema::token::kMintSize);
  // COption tag + key (36), supply (8), then decimals.
  EXPECT_EQ(data[44], 6u);

  auto decoded = raceswap::schema::token::try_decode_mint(data);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, mint);
}

TEST(token, mint_decode_fails_closed) {
  auto mint = raceswap::schema::token::mint_t{.decimals = 9,
                                              .is_initialized = true};
  auto data = raceswap::schema::token::encode_mint(mint);

  auto short_data = data;
  short_data.resize(81);
  EXPECT_FALSE(raceswap::schema::token::try_decode_mint(short_data));

  auto uninitialized = raceswap::schema::token::encode_mint(
      raceswap::schema::token::mint_t{.decimals = 9});
  EXPECT_FALSE(raceswap::schema::token::try_decode_mint(uninitialized));

  auto bad_tag = data;
  bad_tag[0] = 2;
  EXPECT_FALSE(raceswap::schema::token::try_decode_mint(bad_tag));

  // Token-2022 extension bytes after the base record are tolerated.
  auto extended = data;
  extended.resize(120, 0xaa);
  EXPECT_TRUE(raceswap::schema::token::try_decode_mint(extended));
}

TEST(token, token_account_round_trips_and_rejects_uninitialized) {
  auto account = raceswap::schema::token::token_account_t{
      .mint = make_hash(1),
      .owner = make_hash(2),
      .amount = 42,
      .delegate = make_hash(3),
      .delegated_amount = 10};
  auto data = raceswap::schema::token::encode_token_account(account);
  ASSERT_EQ(data.size(), raceswap::schema::token::kTokenAccountSize);
  auto decoded = raceswap::schema::token::try_decode_token_account(data);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, account);

  account.state = raceswap::schema::token::account_state_t::uninitialized;
  EXPECT_FALSE(raceswap::schema::token::try_decode_token_account(
      raceswap::schema::token::encode_token_account(account)));

  data.resize(164);
  EXPECT_FALSE(raceswap::schema::token::try_decode_token_account(data));
}
