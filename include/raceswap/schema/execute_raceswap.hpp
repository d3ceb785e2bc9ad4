#pragma once
#include <raceswap/schema/primitives.hpp>
#include <raceswap/schema/serialized_instruction.hpp>
#include <cstdint>
#include <optional>

// Schema type: execute raceswap.
// Forwarding workflow: custodial two-leg request. The input is moved into a
// vault owned by the derived authority; an optional reflection leg converts
// the reflection share, the main leg converts the rest.
namespace raceswap::schema {

struct execute_raceswap_t final {
  pubkey_t input_mint{};
  pubkey_t main_output_mint{};
  pubkey_t reflection_mint{};
  uint64_t total_input_amount{};
  uint64_t min_main_out{};
  uint64_t min_reflection_out{};
  bool disable_reflection{};
  std::optional<serialized_instruction_t> main_leg;
  std::optional<serialized_instruction_t> reflection_leg;
};

}  // namespace raceswap::schema
