#pragma once
#include <raceswap/schema/primitives.hpp>

namespace raceswap::schema {

struct initialize_config_t final {
  pubkey_t authority{};
  pubkey_t treasury_wallet{};
  basis_points_t reflection_fee_bps{};
  basis_points_t treasury_fee_bps{};
};

}  // namespace raceswap::schema
