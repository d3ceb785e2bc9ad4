#include <raceswap/execution/processor.hpp>
#include <raceswap/execution/vault_authority.hpp>
#include <raceswap/runtime/system_program.hpp>
#include <raceswap/schema/program_instruction.hpp>
#include <raceswap/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

using raceswap::schema::swap_error_code;
using raceswap::schema::update_config_t;
using raceswap::testing::make_hash;

namespace {

class config_test : public raceswap::testing::ledger_fixture {
 protected:
  static uint32_t code_of(const swap_error_code code) {
    return static_cast<uint32_t>(code);
  }
};

}  // namespace

TEST_F(config_test, initialize_creates_program_owned_record) {
  auto result = initialize_config(150, 20);
  ASSERT_TRUE(result.ok()) << result.log << " " << result.info;

  auto account = ledger().account(config_address);
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->owner, config.program_id);
  EXPECT_EQ(account->data.size(), raceswap::schema::kConfigAccountSize);
  EXPECT_EQ(account->lamports, raceswap::runtime::rent_exempt_minimum(
                                   raceswap::schema::kConfigAccountSize));

  auto stored = stored_config();
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->authority, admin);
  EXPECT_EQ(stored->treasury_wallet, treasury_wallet);
  EXPECT_EQ(stored->reflection_fee_bps, 150u);
  EXPECT_EQ(stored->treasury_fee_bps, 20u);
  EXPECT_EQ(stored->bump,
            raceswap::execution::find_config_address(config.program_id)->bump);
  EXPECT_EQ(stored->authority_bump, authority->bump());

  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, "config_updated");
  EXPECT_EQ(result.events[0].attribute("reflection_fee_bps"), "150");
}

TEST_F(config_test, initialize_runs_once) {
  ASSERT_TRUE(initialize_config(150, 20).ok());
  auto again = initialize_config(10, 10);
  EXPECT_EQ(again.code, code_of(swap_error_code::config_already_initialized));
  EXPECT_EQ(stored_config()->reflection_fee_bps, 150u);
}

TEST_F(config_test, initialize_rejects_bad_rates) {
  auto result = initialize_config(1'001, 20);
  EXPECT_EQ(result.code, code_of(swap_error_code::invalid_fee_config));
  EXPECT_FALSE(stored_config().has_value());
  EXPECT_EQ(lamports(admin), raceswap::testing::kUserLamports);
}

TEST_F(config_test, initialize_requires_derived_address_and_signer) {
  auto params = raceswap::schema::initialize_config_t{
      .authority = admin, .treasury_wallet = treasury_wallet};
  auto elsewhere = make_hash(0x90);
  auto wrong_address = ledger().execute(raceswap::runtime::transaction_t{
      .signers = {admin},
      .instructions = {raceswap::schema::instruction_t{
          .program_id = config.program_id,
          .accounts = {writable(elsewhere), signer(admin),
                       readonly(config.system_program)},
          .data = raceswap::schema::encode_instruction(params)}}});
  EXPECT_EQ(wrong_address.code, code_of(swap_error_code::config_missing));

  auto unsigned_payer = ledger().execute(raceswap::runtime::transaction_t{
      .signers = {},
      .instructions = {raceswap::schema::instruction_t{
          .program_id = config.program_id,
          .accounts = {writable(config_address), writable(admin),
                       readonly(config.system_program)},
          .data = raceswap::schema::encode_instruction(params)}}});
  EXPECT_EQ(unsigned_payer.code, code_of(swap_error_code::missing_signature));

  auto wrong_system = ledger().execute(raceswap::runtime::transaction_t{
      .signers = {admin},
      .instructions = {raceswap::schema::instruction_t{
          .program_id = config.program_id,
          .accounts = {writable(config_address), signer(admin),
                       readonly(make_hash(0x91))},
          .data = raceswap::schema::encode_instruction(params)}}});
  EXPECT_EQ(wrong_system.code,
            code_of(swap_error_code::invalid_program_account));
  EXPECT_FALSE(stored_config().has_value());
}

TEST_F(config_test, authority_updates_only_named_fields) {
  ASSERT_TRUE(initialize_config(150, 20).ok());
  auto result = update_config(update_config_t{.reflection_fee_bps = 300}, admin);
  ASSERT_TRUE(result.ok()) << result.log << " " << result.info;

  auto stored = stored_config();
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->reflection_fee_bps, 300u);
  EXPECT_EQ(stored->treasury_fee_bps, 20u);
  EXPECT_EQ(stored->authority, admin);
  EXPECT_EQ(stored->treasury_wallet, treasury_wallet);
}

TEST_F(config_test, rejected_updates_leave_config_unchanged) {
  ASSERT_TRUE(initialize_config(150, 20).ok());
  auto before = stored_config();
  auto root = ledger().state_root();

  auto stranger = update_config(update_config_t{.treasury_fee_bps = 0}, user);
  EXPECT_EQ(stranger.code, code_of(swap_error_code::unauthorized));

  auto too_high =
      update_config(update_config_t{.treasury_fee_bps = 1'001}, admin);
  EXPECT_EQ(too_high.code, code_of(swap_error_code::invalid_fee_config));

  auto unsigned_authority = ledger().execute(raceswap::runtime::transaction_t{
      .signers = {},
      .instructions = {raceswap::schema::instruction_t{
          .program_id = config.program_id,
          .accounts = {writable(config_address), readonly(admin)},
          .data = raceswap::schema::encode_instruction(
              update_config_t{.reflection_fee_bps = 0})}}});
  EXPECT_EQ(unsigned_authority.code,
            code_of(swap_error_code::missing_signature));

  EXPECT_EQ(stored_config(), before);
  EXPECT_EQ(ledger().state_root(), root);
}

TEST_F(config_test, authority_can_be_handed_over) {
  ASSERT_TRUE(initialize_config(150, 20).ok());
  ASSERT_TRUE(update_config(update_config_t{.new_authority = user}, admin).ok());

  EXPECT_EQ(update_config(update_config_t{.reflection_fee_bps = 1}, admin).code,
            code_of(swap_error_code::unauthorized));
  ASSERT_TRUE(
      update_config(update_config_t{.reflection_fee_bps = 1}, user).ok());
  EXPECT_EQ(stored_config()->authority, user);
  EXPECT_EQ(stored_config()->reflection_fee_bps, 1u);
}

TEST_F(config_test, update_before_initialize_is_missing) {
  auto result = update_config(update_config_t{.reflection_fee_bps = 1}, admin);
  EXPECT_EQ(result.code, code_of(swap_error_code::config_missing));
}

TEST_F(config_test, undecodable_instruction_is_rejected) {
  auto result = ledger().execute(raceswap::runtime::transaction_t{
      .signers = {admin},
      .instructions = {raceswap::schema::instruction_t{
          .program_id = config.program_id,
          .accounts = {signer(admin)},
          .data = {0x01, 0x02, 0x03}}}});
  EXPECT_EQ(result.code, code_of(swap_error_code::invalid_instruction));
}
