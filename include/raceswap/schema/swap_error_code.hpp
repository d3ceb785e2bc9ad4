#pragma once

#include <raceswap/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace raceswap::schema {

// Values below 6100 keep the numbering clients of the deployed program
// already decode; 6018 and 6019 are retired.
enum class swap_error_code : uint32_t {
  invalid_fee_config = 6000,
  math_overflow = 6001,
  unauthorized = 6002,
  missing_reflection_leg = 6003,
  missing_main_leg = 6004,
  unexpected_reflection_leg = 6005,
  invalid_amount = 6006,
  invalid_reflection_account = 6007,
  invalid_main_account = 6008,
  invalid_vault_mint = 6009,
  invalid_vault_owner = 6010,
  invalid_user_source = 6011,
  reflection_below_min_out = 6012,
  main_below_min_out = 6013,
  swap_cpi_failed = 6014,
  account_mismatch = 6015,
  invalid_reflection_accounting = 6016,
  invalid_main_accounting = 6017,
  invalid_treasury_account = 6020,
  invalid_input_mint_owner = 6021,
  invalid_input_mint = 6022,
  invalid_instruction = 6100,
  invalid_leg_shape = 6101,
  invalid_account_index = 6102,
  invalid_account_encoding = 6103,
  invalid_program_account = 6104,
  missing_signature = 6105,
  config_already_initialized = 6106,
  config_missing = 6107,
  fee_transfer_failed = 6108,
  input_transfer_failed = 6109,
};

inline constexpr auto kSwapErrorMessages = std::array{
    std::pair<std::string_view, swap_error_code>{
        "invalid fee configuration", swap_error_code::invalid_fee_config},
    std::pair<std::string_view, swap_error_code>{
        "math overflow", swap_error_code::math_overflow},
    std::pair<std::string_view, swap_error_code>{
        "unauthorized", swap_error_code::unauthorized},
    std::pair<std::string_view, swap_error_code>{
        "reflection leg required", swap_error_code::missing_reflection_leg},
    std::pair<std::string_view, swap_error_code>{
        "main leg required", swap_error_code::missing_main_leg},
    std::pair<std::string_view, swap_error_code>{
        "reflection leg unexpected when disabled or dusted",
        swap_error_code::unexpected_reflection_leg},
    std::pair<std::string_view, swap_error_code>{
        "invalid amount", swap_error_code::invalid_amount},
    std::pair<std::string_view, swap_error_code>{
        "invalid reflection token account",
        swap_error_code::invalid_reflection_account},
    std::pair<std::string_view, swap_error_code>{
        "invalid main token account", swap_error_code::invalid_main_account},
    std::pair<std::string_view, swap_error_code>{
        "invalid vault mint", swap_error_code::invalid_vault_mint},
    std::pair<std::string_view, swap_error_code>{
        "invalid vault owner", swap_error_code::invalid_vault_owner},
    std::pair<std::string_view, swap_error_code>{
        "invalid user source account", swap_error_code::invalid_user_source},
    std::pair<std::string_view, swap_error_code>{
        "reflection amount below min",
        swap_error_code::reflection_below_min_out},
    std::pair<std::string_view, swap_error_code>{
        "main amount below min", swap_error_code::main_below_min_out},
    std::pair<std::string_view, swap_error_code>{
        "swap cpi failed", swap_error_code::swap_cpi_failed},
    std::pair<std::string_view, swap_error_code>{
        "account mismatch for serialized instruction",
        swap_error_code::account_mismatch},
    std::pair<std::string_view, swap_error_code>{
        "invalid reflection accounting delta",
        swap_error_code::invalid_reflection_accounting},
    std::pair<std::string_view, swap_error_code>{
        "invalid main accounting delta",
        swap_error_code::invalid_main_accounting},
    std::pair<std::string_view, swap_error_code>{
        "invalid treasury account", swap_error_code::invalid_treasury_account},
    std::pair<std::string_view, swap_error_code>{
        "input mint owner does not match provided token program",
        swap_error_code::invalid_input_mint_owner},
    std::pair<std::string_view, swap_error_code>{
        "invalid input mint", swap_error_code::invalid_input_mint},
    std::pair<std::string_view, swap_error_code>{
        "invalid instruction data", swap_error_code::invalid_instruction},
    std::pair<std::string_view, swap_error_code>{
        "leg flag count does not match account count",
        swap_error_code::invalid_leg_shape},
    std::pair<std::string_view, swap_error_code>{
        "account index out of range", swap_error_code::invalid_account_index},
    std::pair<std::string_view, swap_error_code>{
        "instruction does not match configured account encoding",
        swap_error_code::invalid_account_encoding},
    std::pair<std::string_view, swap_error_code>{
        "invalid program account", swap_error_code::invalid_program_account},
    std::pair<std::string_view, swap_error_code>{
        "missing required signature", swap_error_code::missing_signature},
    std::pair<std::string_view, swap_error_code>{
        "config already initialized",
        swap_error_code::config_already_initialized},
    std::pair<std::string_view, swap_error_code>{
        "config account missing or malformed",
        swap_error_code::config_missing},
    std::pair<std::string_view, swap_error_code>{
        "treasury fee transfer failed", swap_error_code::fee_transfer_failed},
    std::pair<std::string_view, swap_error_code>{
        "input transfer into vault failed",
        swap_error_code::input_transfer_failed},
};

inline constexpr std::string_view to_string(const swap_error_code value) {
  return to_string(value, kSwapErrorMessages).value_or("unknown error");
}

}  // namespace raceswap::schema
