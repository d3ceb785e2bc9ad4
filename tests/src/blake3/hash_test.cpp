#include <gtest/gtest.h>
#include <raceswap/blake3/hash.hpp>

#include <string_view>

TEST(blake3, empty_input_digest) {
  EXPECT_EQ(raceswap::schema::to_hex(raceswap::blake3::hash(std::string_view{})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
  EXPECT_EQ(raceswap::blake3::hasher{}.finalize(),
            raceswap::blake3::hash(std::string_view{}));
}

TEST(blake3, incremental_updates_match_one_shot) {
  auto whole = raceswap::schema::make_bytes(std::string_view{"ACCT|record"});
  auto left = raceswap::schema::make_bytes(std::string_view{"ACCT|"});
  auto right = raceswap::schema::make_bytes(std::string_view{"record"});
  auto hasher = raceswap::blake3::hasher{};
  hasher.update(left).update(right);
  EXPECT_EQ(hasher.finalize(), raceswap::blake3::hash(
                                   raceswap::schema::bytes_view_t{whole}));
}
