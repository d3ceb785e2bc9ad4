#include <raceswap/execution/permission_reconciler.hpp>
#include <raceswap/execution/program_config.hpp>
#include <raceswap/execution/vault_authority.hpp>
#include <raceswap/testing/common.hpp>
#include <gtest/gtest.h>

using raceswap::execution::resolved_account_t;
using raceswap::testing::make_hash;

TEST(permission_reconciler, writable_follows_the_grant) {
  auto metas = raceswap::execution::reconcile(
      {resolved_account_t{.key = make_hash(1), .granted_writable = true},
       resolved_account_t{.key = make_hash(2), .granted_writable = false}});
  ASSERT_EQ(metas.size(), 2u);
  EXPECT_TRUE(metas[0].is_writable);
  EXPECT_FALSE(metas[1].is_writable);
}

TEST(permission_reconciler, signer_needs_request_and_grant) {
  auto metas = raceswap::execution::reconcile(
      {resolved_account_t{.key = make_hash(1),
                          .granted_signer = true,
                          .requested_signer = true},
       resolved_account_t{.key = make_hash(2),
                          .granted_signer = true,
                          .requested_signer = false},
       resolved_account_t{.key = make_hash(3),
                          .granted_signer = false,
                          .requested_signer = true}});
  ASSERT_EQ(metas.size(), 3u);
  EXPECT_TRUE(metas[0].is_signer);
  EXPECT_FALSE(metas[1].is_signer);
  EXPECT_FALSE(metas[2].is_signer);
}

TEST(permission_reconciler, derived_authority_never_signs) {
  auto program_id = make_hash(0x10);
  auto config = raceswap::execution::find_config_address(program_id);
  ASSERT_TRUE(config.has_value());
  auto authority =
      raceswap::execution::derived_authority::derive(config->address,
                                                     program_id);
  ASSERT_TRUE(authority.has_value());

  auto metas = raceswap::execution::reconcile(
      {resolved_account_t{.key = authority->address(),
                          .granted_signer = true,
                          .granted_writable = true,
                          .requested_signer = true},
       resolved_account_t{.key = make_hash(7),
                          .granted_signer = true,
                          .requested_signer = true}},
      authority);
  ASSERT_EQ(metas.size(), 2u);
  EXPECT_EQ(metas[0].pubkey, authority->address());
  EXPECT_FALSE(metas[0].is_signer);
  EXPECT_TRUE(metas[0].is_writable);
  EXPECT_TRUE(metas[1].is_signer);
}

TEST(permission_reconciler, order_and_duplicates_are_kept) {
  auto metas = raceswap::execution::reconcile(
      {resolved_account_t{.key = make_hash(2)},
       resolved_account_t{.key = make_hash(1)},
       resolved_account_t{.key = make_hash(2)}});
  ASSERT_EQ(metas.size(), 3u);
  EXPECT_EQ(metas[0].pubkey, make_hash(2));
  EXPECT_EQ(metas[1].pubkey, make_hash(1));
  EXPECT_EQ(metas[2].pubkey, make_hash(2));
}
