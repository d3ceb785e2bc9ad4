#pragma once
#include <raceswap/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>

// Schema type: fee config.
// Configuration workflow: protocol fee rates, the principal allowed to change
// them, and where treasury fees go. Persisted as a fixed 70-byte record.
namespace raceswap::schema {

inline constexpr auto kFeeDenominator = uint32_t{10'000};
inline constexpr auto kMaxFeeBps = basis_points_t{1'000};
inline constexpr auto kFeeConfigRecordSize = std::size_t{32 + 32 + 2 + 2 + 1 + 1};

struct fee_config_t final {
  pubkey_t authority{};
  pubkey_t treasury_wallet{};
  basis_points_t reflection_fee_bps{};
  basis_points_t treasury_fee_bps{};
  uint8_t bump{};
  uint8_t authority_bump{};

  friend bool operator==(const fee_config_t&, const fee_config_t&) = default;
};

}  // namespace raceswap::schema
