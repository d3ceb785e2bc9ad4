#include <gtest/gtest.h>
#include <raceswap/address/program_address.hpp>
#include <raceswap/crypto/curve25519.hpp>

namespace {

raceswap::schema::pubkey_t upgradeable_loader() {
  return raceswap::schema::make_pubkey(
      "BPFLoaderUpgradeab1e11111111111111111111111");
}

raceswap::schema::bytes_t seed(const std::string_view text) {
  return raceswap::schema::make_bytes(text);
}

}  // namespace

TEST(program_address, create_matches_reference_vectors) {
  auto empty_bump = raceswap::address::create_program_address(
      raceswap::schema::seeds_t{seed(""), raceswap::schema::bytes_t{1}},
      upgradeable_loader());
  ASSERT_TRUE(empty_bump.has_value());
  EXPECT_EQ(raceswap::schema::to_string(*empty_bump),
            "BwqrghZA2htAcqq8dzP1WDAhTXYTYWj7CHxF5j7TDBAe");

  auto two_seeds = raceswap::address::create_program_address(
      raceswap::schema::seeds_t{seed("Talking"), seed("Squirrels")},
      upgradeable_loader());
  ASSERT_TRUE(two_seeds.has_value());
  EXPECT_EQ(raceswap::schema::to_string(*two_seeds),
            "2fnQrngrQT4SeLcdToJAD96phoEjNL2man2kfRLCASVk");
}

TEST(program_address, find_returns_highest_off_curve_bump) {
  auto seeds = raceswap::schema::seeds_t{seed("raceswap-config")};
  auto found =
      raceswap::address::find_program_address(seeds, upgradeable_loader());
  ASSERT_TRUE(found.has_value());
  EXPECT_FALSE(raceswap::crypto::is_on_curve(found->address));

  auto with_bump = seeds;
  with_bump.push_back(raceswap::schema::bytes_t{found->bump});
  EXPECT_EQ(raceswap::address::create_program_address(with_bump,
                                                      upgradeable_loader()),
            found->address);

  // Every higher bump is either on the curve or yields another address.
  for (auto bump = 255; bump > found->bump; --bump) {
    auto higher = seeds;
    higher.push_back(raceswap::schema::bytes_t{static_cast<uint8_t>(bump)});
    EXPECT_FALSE(raceswap::address::create_program_address(
                     higher, upgradeable_loader())
                     .has_value());
  }
}

TEST(program_address, derivation_depends_on_program_id) {
  auto seeds = raceswap::schema::seeds_t{seed("raceswap-authority")};
  auto a = raceswap::address::find_program_address(seeds, upgradeable_loader());
  auto b = raceswap::address::find_program_address(
      seeds, raceswap::schema::make_zero_pubkey());
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_NE(a->address, b->address);
}

TEST(program_address, rejects_oversized_seeds) {
  auto long_seed = raceswap::schema::bytes_t(
      raceswap::address::kMaxSeedLength + 1, 0x01);
  EXPECT_FALSE(raceswap::address::create_program_address(
                   raceswap::schema::seeds_t{long_seed}, upgradeable_loader())
                   .has_value());

  auto many = raceswap::schema::seeds_t(raceswap::address::kMaxSeeds + 1,
                                        raceswap::schema::bytes_t{0x01});
  EXPECT_FALSE(
      raceswap::address::find_program_address(many, upgradeable_loader())
          .has_value());
}
