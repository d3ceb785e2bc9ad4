#include <raceswap/execution/program_config.hpp>
#include <raceswap/execution/vault_authority.hpp>

#include <fmt/format.h>

#include <iterator>

using namespace raceswap::schema;

namespace raceswap::execution {

namespace {

seeds_t authority_seeds(const pubkey_t& config) {
  return seeds_t{make_bytes(kAuthoritySeed),
                 bytes_t{std::begin(config), std::end(config)}};
}

}  // namespace

derived_authority::derived_authority(const pubkey_t& address,
                                     const uint8_t bump)
    : address_{address}, bump_{bump} {}

std::optional<derived_authority> derived_authority::derive(
    const pubkey_t& config,
    const pubkey_t& program_id) {
  auto found = raceswap::address::find_program_address(authority_seeds(config),
                                                       program_id);
  if (!found) {
    return std::nullopt;
  }
  return derived_authority{found->address, found->bump};
}

std::optional<derived_authority> derived_authority::from_bump(
    const pubkey_t& config,
    const uint8_t bump,
    const pubkey_t& program_id) {
  auto seeds = authority_seeds(config);
  seeds.push_back(bytes_t{bump});
  auto address = raceswap::address::create_program_address(seeds, program_id);
  if (!address) {
    return std::nullopt;
  }
  return derived_authority{*address, bump};
}

std::optional<raceswap::address::program_address_t> find_config_address(
    const pubkey_t& program_id) {
  return raceswap::address::find_program_address(
      seeds_t{make_bytes(kConfigSeed)}, program_id);
}

status_t verify_vault(const token::token_account_t& vault,
                      const derived_authority& authority,
                      const pubkey_t& input_mint) {
  if (vault.owner != authority.address()) {
    return fail(swap_error_code::invalid_vault_owner,
                fmt::format("vault owner {} is not the authority {}",
                            to_string(vault.owner),
                            to_string(authority.address())));
  }
  if (vault.mint != input_mint) {
    return fail(swap_error_code::invalid_vault_mint, to_string(vault.mint));
  }
  return std::nullopt;
}

}  // namespace raceswap::execution
