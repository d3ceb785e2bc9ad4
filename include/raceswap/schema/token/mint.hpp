#pragma once
#include <raceswap/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

// Schema type: token mint.
// Token workflow: packed mint record of the token programs. Token-2022 mints
// may carry extension bytes after the base record.
namespace raceswap::schema::token {

inline constexpr auto kMintSize = std::size_t{82};

struct mint_t final {
  std::optional<pubkey_t> mint_authority;
  uint64_t supply{};
  uint8_t decimals{};
  bool is_initialized{};
  std::optional<pubkey_t> freeze_authority;

  friend bool operator==(const mint_t&, const mint_t&) = default;
};

/// Decode the base mint record. Fails on short input, on malformed option
/// tags and on an uninitialized mint.
std::optional<mint_t> try_decode_mint(const bytes_view_t& data);

bytes_t encode_mint(const mint_t& mint);

}  // namespace raceswap::schema::token
