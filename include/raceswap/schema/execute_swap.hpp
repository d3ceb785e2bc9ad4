#pragma once
#include <raceswap/schema/account_reference.hpp>
#include <raceswap/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: execute swap.
// Forwarding workflow: single-leg passthrough request; the requester's own
// signature authorizes the forwarded call. Two wire forms share one
// instruction name and differ only in how accounts are referenced.
namespace raceswap::schema {

struct execute_swap_t final {
  uint64_t amount{};
  uint64_t min_out{};
  std::vector<full_account_reference_t> accounts;
  bytes_t data;
};

struct execute_swap_indexed_t final {
  uint64_t amount{};
  uint64_t min_out{};
  std::vector<indexed_account_reference_t> accounts;
  bytes_t data;
};

}  // namespace raceswap::schema
