#pragma once
#include <raceswap/schema/primitives.hpp>
#include <cstdint>

// Schema type: swap executed.
// Observability workflow: emitted once per committed swap.
namespace raceswap::schema {

struct swap_executed_t final {
  pubkey_t user{};
  pubkey_t input_mint{};
  pubkey_t main_output_mint{};
  pubkey_t reflection_output_mint{};
  uint64_t total_in{};
  uint64_t main_amount{};
  uint64_t reflection_amount{};
  uint64_t treasury_amount{};
};

}  // namespace raceswap::schema
