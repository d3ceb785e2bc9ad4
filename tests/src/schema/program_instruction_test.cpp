#include <gtest/gtest.h>
#include <raceswap/schema/program_instruction.hpp>
#include <raceswap/testing/common.hpp>

#include <algorithm>
#include <iterator>
#include <variant>

namespace {

using raceswap::testing::make_hash;

raceswap::schema::serialized_instruction_t make_leg(const uint16_t count) {
  return raceswap::schema::serialized_instruction_t{
      .accounts_len = count,
      .data = {0xde, 0xad},
      .is_writable = std::vector<bool>(count, true),
      .is_signer = std::vector<bool>(count, false)};
}

}  // namespace

TEST(program_instruction, instruction_discriminator_uses_global_namespace) {
  // sha256("global:initialize")[0..8]
  auto discriminator =
      raceswap::schema::instruction_discriminator("initialize");
  EXPECT_EQ(discriminator, (raceswap::schema::discriminator_t{
                               0xaf, 0xaf, 0x6d, 0x1f, 0x0d, 0x98, 0x9b, 0xed}));
}

TEST(program_instruction, namespaces_produce_distinct_discriminators) {
  EXPECT_NE(raceswap::schema::instruction_discriminator("SwapExecuted"),
            raceswap::schema::event_discriminator("SwapExecuted"));
  EXPECT_NE(raceswap::schema::account_discriminator("RaceswapConfig"),
            raceswap::schema::event_discriminator("RaceswapConfig"));
}

TEST(program_instruction, execute_raceswap_round_trips_with_optional_legs) {
  auto request = raceswap::schema::execute_raceswap_t{
      .input_mint = make_hash(1),
      .main_output_mint = make_hash(2),
      .reflection_mint = make_hash(3),
      .total_input_amount = 1'000'000,
      .min_main_out = 10,
      .min_reflection_out = 5,
      .disable_reflection = false,
      .main_leg = make_leg(4)};
  auto data = raceswap::schema::encode_instruction(request);

  auto decoded = raceswap::schema::try_decode_instruction(
      data, raceswap::schema::account_encoding_t::full);
  ASSERT_TRUE(decoded.has_value());
  auto* swap = std::get_if<raceswap::schema::execute_raceswap_t>(&*decoded);
  ASSERT_NE(swap, nullptr);
  EXPECT_EQ(swap->total_input_amount, 1'000'000u);
  ASSERT_TRUE(swap->main_leg.has_value());
  EXPECT_EQ(swap->main_leg->accounts_len, 4u);
  EXPECT_EQ(swap->main_leg->data, (raceswap::schema::bytes_t{0xde, 0xad}));
  EXPECT_FALSE(swap->reflection_leg.has_value());
}

TEST(program_instruction, execute_swap_decodes_per_account_encoding) {
  auto indexed = raceswap::schema::execute_swap_indexed_t{
      .amount = 7,
      .min_out = 1,
      .accounts = {{.index = 0, .is_writable = true},
                   {.index = 2, .is_writable = false}},
      .data = {0x01}};
  auto data = raceswap::schema::encode_instruction(indexed);
  // Discriminator, two u64, u32 count, two 2-byte records, u32 + 1 byte.
  EXPECT_EQ(data.size(), 8u + 16u + 4u + 4u + 5u);

  auto as_indexed = raceswap::schema::try_decode_instruction(
      data, raceswap::schema::account_encoding_t::indexed);
  ASSERT_TRUE(as_indexed.has_value());
  auto* swap =
      std::get_if<raceswap::schema::execute_swap_indexed_t>(&*as_indexed);
  ASSERT_NE(swap, nullptr);
  ASSERT_EQ(swap->accounts.size(), 2u);
  EXPECT_EQ(swap->accounts[1].index, 2u);

  // The same bytes do not parse as 34-byte full references.
  EXPECT_FALSE(raceswap::schema::try_decode_instruction(
                   data, raceswap::schema::account_encoding_t::full)
                   .has_value());
}

TEST(program_instruction, full_reference_is_thirty_four_bytes) {
  auto one = raceswap::schema::execute_swap_t{
      .accounts = {{.pubkey = make_hash(9), .is_signer = true}}};
  auto none = raceswap::schema::execute_swap_t{};
  EXPECT_EQ(raceswap::schema::encode_instruction(one).size() -
                raceswap::schema::encode_instruction(none).size(),
            raceswap::schema::kFullAccountReferenceSize);
}

TEST(program_instruction, rejects_trailing_bytes_and_unknown_discriminators) {
  auto data = raceswap::schema::encode_instruction(
      raceswap::schema::update_config_t{.reflection_fee_bps = 10});
  data.push_back(0x00);
  EXPECT_FALSE(raceswap::schema::try_decode_instruction(
                   data, raceswap::schema::account_encoding_t::full)
                   .has_value());

  auto unknown = raceswap::schema::bytes_t(16, 0x42);
  EXPECT_FALSE(raceswap::schema::try_decode_instruction(
                   unknown, raceswap::schema::account_encoding_t::full)
                   .has_value());
  EXPECT_FALSE(raceswap::schema::try_decode_instruction(
                   raceswap::schema::bytes_t{0x01},
                   raceswap::schema::account_encoding_t::full)
                   .has_value());
}

TEST(program_instruction, rejects_option_tags_and_bools_above_one) {
  auto data = raceswap::schema::encode_instruction(
      raceswap::schema::update_config_t{});
  // Four absent options follow the discriminator.
  ASSERT_EQ(data.size(), 8u + 4u);
  data[8] = 0x02;
  EXPECT_FALSE(raceswap::schema::try_decode_instruction(
                   data, raceswap::schema::account_encoding_t::full)
                   .has_value());
}

TEST(program_instruction, config_account_layout_is_fixed) {
  auto config = raceswap::schema::fee_config_t{
      .authority = make_hash(1),
      .treasury_wallet = make_hash(2),
      .reflection_fee_bps = 150,
      .treasury_fee_bps = 20,
      .bump = 254,
      .authority_bump = 253};
  auto data = raceswap::schema::encode_config_account(config);
  ASSERT_EQ(data.size(), raceswap::schema::kConfigAccountSize);
  EXPECT_EQ(data.size(), 78u);
  auto discriminator =
      raceswap::schema::account_discriminator("RaceswapConfig");
  EXPECT_TRUE(std::equal(std::begin(discriminator), std::end(discriminator),
                         std::begin(data)));
  // reflection_fee_bps little-endian after the two keys.
  EXPECT_EQ(data[8 + 64], 150u);
  EXPECT_EQ(data[8 + 65], 0u);
  EXPECT_EQ(data[77], 253u);

  // Allocated space past the record is ignored.
  data.resize(128, 0);
  auto decoded = raceswap::schema::try_decode_config_account(data);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, config);

  data.resize(77);
  EXPECT_FALSE(raceswap::schema::try_decode_config_account(data).has_value());
}

TEST(program_instruction, events_are_framed_with_event_discriminator) {
  auto event = raceswap::schema::swap_executed_t{.user = make_hash(1),
                                                 .total_in = 100};
  auto data = raceswap::schema::encode_event(event);
  EXPECT_EQ(data.size(), 8u + 4u * 32u + 4u * 8u);
  auto discriminator = raceswap::schema::event_discriminator("SwapExecuted");
  EXPECT_TRUE(std::equal(std::begin(discriminator), std::end(discriminator),
                         std::begin(data)));
}
