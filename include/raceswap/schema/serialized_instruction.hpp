#pragma once
#include <raceswap/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: serialized instruction.
// Forwarding workflow: one opaque leg of a swap. `data` is the aggregator's
// own instruction encoding and is never interpreted here.
namespace raceswap::schema {

struct serialized_instruction_t final {
  uint16_t accounts_len{};
  bytes_t data;
  std::vector<bool> is_writable;
  std::vector<bool> is_signer;
};

}  // namespace raceswap::schema
