#pragma once

#include <raceswap/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace raceswap::runtime {

inline constexpr auto kRuntimeCodespace = std::string_view{"raceswap.runtime"};

enum class runtime_error_code : uint32_t {
  program_missing = 1,
  missing_signature = 2,
  privilege_escalation = 3,
  account_not_provided = 4,
  readonly_account_modified = 5,
  external_account_modified = 6,
  insufficient_funds = 7,
  invalid_instruction_data = 8,
  call_depth_exceeded = 9,
  account_already_in_use = 10,
  invalid_account_data = 11,
  owner_mismatch = 12,
  mint_mismatch = 13,
  account_frozen = 14,
  unbalanced_instruction = 15,
  arithmetic_overflow = 16,
};

inline constexpr auto kRuntimeErrorMessages = std::array{
    std::pair<std::string_view, runtime_error_code>{
        "program not registered", runtime_error_code::program_missing},
    std::pair<std::string_view, runtime_error_code>{
        "missing required signature", runtime_error_code::missing_signature},
    std::pair<std::string_view, runtime_error_code>{
        "cross-program invocation with unauthorized signer or writable "
        "account",
        runtime_error_code::privilege_escalation},
    std::pair<std::string_view, runtime_error_code>{
        "account not provided to the invoking program",
        runtime_error_code::account_not_provided},
    std::pair<std::string_view, runtime_error_code>{
        "instruction modified a read-only account",
        runtime_error_code::readonly_account_modified},
    std::pair<std::string_view, runtime_error_code>{
        "instruction modified data or debited an account it does not own",
        runtime_error_code::external_account_modified},
    std::pair<std::string_view, runtime_error_code>{
        "insufficient funds", runtime_error_code::insufficient_funds},
    std::pair<std::string_view, runtime_error_code>{
        "invalid instruction data",
        runtime_error_code::invalid_instruction_data},
    std::pair<std::string_view, runtime_error_code>{
        "cross-program invocation depth exceeded",
        runtime_error_code::call_depth_exceeded},
    std::pair<std::string_view, runtime_error_code>{
        "account already in use", runtime_error_code::account_already_in_use},
    std::pair<std::string_view, runtime_error_code>{
        "invalid account data", runtime_error_code::invalid_account_data},
    std::pair<std::string_view, runtime_error_code>{
        "owner does not match", runtime_error_code::owner_mismatch},
    std::pair<std::string_view, runtime_error_code>{
        "account not associated with this mint",
        runtime_error_code::mint_mismatch},
    std::pair<std::string_view, runtime_error_code>{
        "account is frozen", runtime_error_code::account_frozen},
    std::pair<std::string_view, runtime_error_code>{
        "sum of account balances changed",
        runtime_error_code::unbalanced_instruction},
    std::pair<std::string_view, runtime_error_code>{
        "arithmetic overflow", runtime_error_code::arithmetic_overflow},
};

inline constexpr std::string_view to_string(const runtime_error_code value) {
  return raceswap::schema::to_string(value, kRuntimeErrorMessages)
      .value_or("unknown error");
}

}  // namespace raceswap::runtime
