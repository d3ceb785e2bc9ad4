#pragma once

#include <raceswap/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

// Program-derived addresses: deterministic, off-curve addresses that only the
// deriving program can sign for (through the runtime, with the seeds).
namespace raceswap::address {

inline constexpr auto kMaxSeeds = std::size_t{16};
inline constexpr auto kMaxSeedLength = std::size_t{32};

struct program_address_t final {
  raceswap::schema::pubkey_t address{};
  uint8_t bump{};

  friend bool operator==(const program_address_t&,
                         const program_address_t&) = default;
};

/// sha256(seeds || program_id || "ProgramDerivedAddress"). Empty when a seed
/// is too long, there are too many seeds or the digest lies on the curve.
std::optional<raceswap::schema::pubkey_t> create_program_address(
    const raceswap::schema::seeds_t& seeds,
    const raceswap::schema::pubkey_t& program_id);

/// Searches bumps from 255 downwards and returns the first off-curve address.
std::optional<program_address_t> find_program_address(
    const raceswap::schema::seeds_t& seeds,
    const raceswap::schema::pubkey_t& program_id);

}  // namespace raceswap::address
