#pragma once

#include <raceswap/schema/account_encoding.hpp>
#include <raceswap/schema/authority_mode.hpp>
#include <raceswap/schema/primitives.hpp>

#include <string_view>

namespace raceswap::execution {

inline constexpr auto kConfigSeed = std::string_view{"raceswap-config"};
inline constexpr auto kAuthoritySeed = std::string_view{"raceswap-authority"};
inline constexpr auto kDirectTreasuryFeeBps = raceswap::schema::basis_points_t{20};

/// Fixed addresses the program trusts. Production uses the mainnet values;
/// tests inject their own.
struct program_config final {
  raceswap::schema::pubkey_t program_id{};
  raceswap::schema::pubkey_t aggregator_program{};
  /// Fee destination of direct swaps.
  raceswap::schema::pubkey_t treasury{};
  raceswap::schema::pubkey_t system_program{};
  raceswap::schema::pubkey_t token_program{};
  raceswap::schema::pubkey_t token_2022_program{};
  raceswap::schema::basis_points_t direct_treasury_fee_bps{
      kDirectTreasuryFeeBps};
};

/// Which request the engine accepts and how it names forwarded accounts.
///
/// `account_encoding` applies to `direct` mode only. A `derived` engine takes
/// `execute_raceswap`, whose legs always draw their accounts in order from
/// the remaining outer accounts, so the encoding has no effect there.
struct engine_options final {
  raceswap::schema::account_encoding_t account_encoding{
      raceswap::schema::account_encoding_t::full};
  raceswap::schema::authority_mode_t authority_mode{
      raceswap::schema::authority_mode_t::derived};
};

program_config make_mainnet_program_config();

}  // namespace raceswap::execution
