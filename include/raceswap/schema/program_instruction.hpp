#pragma once
#include <raceswap/schema/account_encoding.hpp>
#include <raceswap/schema/config_updated.hpp>
#include <raceswap/schema/execute_raceswap.hpp>
#include <raceswap/schema/execute_swap.hpp>
#include <raceswap/schema/fee_config.hpp>
#include <raceswap/schema/initialize_config.hpp>
#include <raceswap/schema/primitives.hpp>
#include <raceswap/schema/swap_executed.hpp>
#include <raceswap/schema/update_config.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

// Schema type: program instruction.
// Forwarding workflow: framing of the program's instruction data, account
// data and event data. Every record starts with an 8-byte discriminator
// derived from a namespaced name.
namespace raceswap::schema {

using discriminator_t = std::array<uint8_t, 8>;

inline constexpr auto kDiscriminatorSize = std::size_t{8};
inline constexpr auto kConfigAccountSize =
    kDiscriminatorSize + kFeeConfigRecordSize;

inline constexpr auto kInitializeConfigName =
    std::string_view{"initialize_config"};
inline constexpr auto kUpdateConfigName = std::string_view{"update_config"};
inline constexpr auto kExecuteRaceswapName =
    std::string_view{"execute_raceswap"};
inline constexpr auto kExecuteSwapName = std::string_view{"execute_swap"};
inline constexpr auto kConfigAccountName = std::string_view{"RaceswapConfig"};
inline constexpr auto kSwapExecutedName = std::string_view{"SwapExecuted"};
inline constexpr auto kConfigUpdatedName = std::string_view{"ConfigUpdated"};

/// sha256("global:<name>")[0..8]
discriminator_t instruction_discriminator(std::string_view name);
/// sha256("account:<name>")[0..8]
discriminator_t account_discriminator(std::string_view name);
/// sha256("event:<name>")[0..8]
discriminator_t event_discriminator(std::string_view name);

/// `execute_swap` decodes to the full or indexed form depending on the
/// configured account encoding; both share one discriminator.
using program_instruction_t = std::variant<initialize_config_t,
                                           update_config_t,
                                           execute_raceswap_t,
                                           execute_swap_t,
                                           execute_swap_indexed_t>;

std::optional<program_instruction_t> try_decode_instruction(
    const bytes_view_t& data,
    account_encoding_t encoding);

bytes_t encode_instruction(const program_instruction_t& instruction);

bytes_t encode_config_account(const fee_config_t& config);
/// Fails on a wrong discriminator or a short record. Trailing bytes past the
/// record are ignored, as allocated account space may exceed it.
std::optional<fee_config_t> try_decode_config_account(const bytes_view_t& data);

bytes_t encode_event(const swap_executed_t& event);
bytes_t encode_event(const config_updated_t& event);

}  // namespace raceswap::schema
