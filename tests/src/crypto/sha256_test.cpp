#include <gtest/gtest.h>
#include <raceswap/crypto/sha256.hpp>

#include <string_view>
#include <vector>

TEST(sha256, matches_known_digests) {
  EXPECT_EQ(raceswap::schema::to_hex(raceswap::crypto::sha256("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(raceswap::schema::to_hex(
                raceswap::crypto::sha256(std::string_view{})),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(sha256, multipart_digest_equals_concatenated_digest) {
  auto left = raceswap::schema::make_bytes(std::string_view{"global:"});
  auto right = raceswap::schema::make_bytes(std::string_view{"initialize"});
  auto parts = std::vector<raceswap::schema::bytes_view_t>{left, right};
  EXPECT_EQ(raceswap::crypto::sha256(parts),
            raceswap::crypto::sha256("global:initialize"));
}
