#pragma once

#include <raceswap/address/program_address.hpp>
#include <raceswap/execution/status.hpp>
#include <raceswap/schema/primitives.hpp>
#include <raceswap/schema/token/token_account.hpp>

#include <cstdint>
#include <optional>

namespace raceswap::execution {

/// The program authority that owns holding vaults, derived from
/// ("raceswap-authority", config address) under the program id.
///
/// It is never stored and never forwarded as a signer: `restricts` tells the
/// reconciler which key to strip.
class derived_authority final {
 public:
  /// Search the canonical bump.
  static std::optional<derived_authority> derive(
      const raceswap::schema::pubkey_t& config,
      const raceswap::schema::pubkey_t& program_id);

  /// Rebuild from a stored bump. Empty when the bump yields an on-curve
  /// point.
  static std::optional<derived_authority> from_bump(
      const raceswap::schema::pubkey_t& config,
      uint8_t bump,
      const raceswap::schema::pubkey_t& program_id);

  const raceswap::schema::pubkey_t& address() const { return address_; }
  uint8_t bump() const { return bump_; }

  bool restricts(const raceswap::schema::pubkey_t& key) const {
    return key == address_;
  }

 private:
  derived_authority(const raceswap::schema::pubkey_t& address, uint8_t bump);

  raceswap::schema::pubkey_t address_{};
  uint8_t bump_{};
};

/// The config account address ("raceswap-config") and its bump.
std::optional<raceswap::address::program_address_t> find_config_address(
    const raceswap::schema::pubkey_t& program_id);

/// The holding vault must belong to the authority and hold the input mint.
status_t verify_vault(const raceswap::schema::token::token_account_t& vault,
                      const derived_authority& authority,
                      const raceswap::schema::pubkey_t& input_mint);

}  // namespace raceswap::execution
