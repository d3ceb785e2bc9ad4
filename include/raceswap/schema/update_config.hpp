#pragma once
#include <raceswap/schema/primitives.hpp>
#include <optional>

// Schema type: update config.
// Configuration workflow: every field is optional; absent fields keep their
// stored value.
namespace raceswap::schema {

struct update_config_t final {
  std::optional<pubkey_t> new_authority;
  std::optional<pubkey_t> treasury_wallet;
  std::optional<basis_points_t> reflection_fee_bps;
  std::optional<basis_points_t> treasury_fee_bps;
};

}  // namespace raceswap::schema
