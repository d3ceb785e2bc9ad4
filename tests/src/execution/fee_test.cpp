#include <raceswap/execution/fee.hpp>
#include <raceswap/runtime/system_program.hpp>
#include <raceswap/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <string_view>
#include <vector>

using raceswap::testing::make_hash;

namespace {

// Records invocations; answers with a configurable result.
class recording_host final : public raceswap::runtime::host {
 public:
  std::optional<raceswap::schema::account_t> load(
      const raceswap::schema::pubkey_t&) const override {
    return std::nullopt;
  }
  raceswap::schema::transaction_result_t store(
      const raceswap::schema::pubkey_t&,
      const raceswap::schema::account_t&) override {
    return {};
  }
  raceswap::schema::transaction_result_t invoke(
      const raceswap::schema::instruction_t& instruction,
      const raceswap::schema::signer_seeds_t& signer_seeds) override {
    invoked.push_back(instruction);
    seeds_seen += signer_seeds.size();
    return next_result;
  }
  void log(std::string_view) override {}

  std::vector<raceswap::schema::instruction_t> invoked;
  std::size_t seeds_seen{};
  raceswap::schema::transaction_result_t next_result;
};

}  // namespace

TEST(fee, compute_fee_floors_basis_points) {
  EXPECT_EQ(raceswap::execution::compute_fee(1'000'000, 20), 2'000u);
  EXPECT_EQ(raceswap::execution::compute_fee(1'000'000, 150), 15'000u);
  EXPECT_EQ(raceswap::execution::compute_fee(4'999, 20), 9u);
  EXPECT_EQ(raceswap::execution::compute_fee(49, 20), 0u);
  EXPECT_EQ(raceswap::execution::compute_fee(1'000'000, 0), 0u);
}

TEST(fee, compute_fee_uses_wide_intermediate) {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  // amount * bps exceeds 64 bits but the quotient does not.
  EXPECT_EQ(raceswap::execution::compute_fee(kMax, 1'000), kMax / 10);
  EXPECT_EQ(raceswap::execution::compute_fee(kMax, 10'000), kMax);
  EXPECT_FALSE(raceswap::execution::compute_fee(kMax, 10'001).has_value());
}

TEST(fee, valid_fee_rates_bounds_each_rate) {
  EXPECT_TRUE(raceswap::execution::valid_fee_rates(0, 0));
  EXPECT_TRUE(raceswap::execution::valid_fee_rates(1'000, 1'000));
  EXPECT_FALSE(raceswap::execution::valid_fee_rates(1'001, 0));
  EXPECT_FALSE(raceswap::execution::valid_fee_rates(0, 1'001));
}

TEST(fee, zero_fee_issues_no_transfer) {
  auto host = recording_host{};
  auto status = raceswap::execution::collect_treasury_fee(
      host, raceswap::runtime::system_program_id(), make_hash(1), make_hash(2),
      0);
  EXPECT_FALSE(status.has_value());
  EXPECT_TRUE(host.invoked.empty());
}

TEST(fee, fee_is_a_system_transfer_from_the_payer) {
  auto host = recording_host{};
  auto status = raceswap::execution::collect_treasury_fee(
      host, raceswap::runtime::system_program_id(), make_hash(1), make_hash(2),
      2'000);
  EXPECT_FALSE(status.has_value());
  ASSERT_EQ(host.invoked.size(), 1u);
  const auto& transfer = host.invoked[0];
  EXPECT_EQ(transfer.program_id, raceswap::runtime::system_program_id());
  ASSERT_EQ(transfer.accounts.size(), 2u);
  EXPECT_EQ(transfer.accounts[0].pubkey, make_hash(1));
  EXPECT_TRUE(transfer.accounts[0].is_signer);
  EXPECT_EQ(transfer.accounts[1].pubkey, make_hash(2));
  EXPECT_FALSE(transfer.accounts[1].is_signer);
  EXPECT_EQ(host.seeds_seen, 0u);
}

TEST(fee, failed_transfer_is_reported) {
  auto host = recording_host{};
  host.next_result = raceswap::runtime::make_runtime_error(
      raceswap::runtime::runtime_error_code::insufficient_funds);
  auto status = raceswap::execution::collect_treasury_fee(
      host, raceswap::runtime::system_program_id(), make_hash(1), make_hash(2),
      2'000);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->code, raceswap::schema::swap_error_code::fee_transfer_failed);
}
