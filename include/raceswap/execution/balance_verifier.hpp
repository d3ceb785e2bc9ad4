#pragma once

#include <raceswap/execution/status.hpp>
#include <raceswap/runtime/host.hpp>
#include <raceswap/schema/primitives.hpp>
#include <raceswap/schema/swap_error_code.hpp>

#include <cstdint>
#include <optional>

namespace raceswap::execution {

/// Token balance of `account` as the host currently sees it. Empty when the
/// account is missing or is not a token account.
std::optional<uint64_t> read_token_balance(
    const raceswap::runtime::host& host,
    const raceswap::schema::pubkey_t& account);

/// One leg's before/after balances and the output it promised.
struct delta_check_t final {
  uint64_t before{};
  uint64_t after{};
  uint64_t minimum{};
  bool require_positive{};
  raceswap::schema::swap_error_code accounting_error{};
  raceswap::schema::swap_error_code below_minimum_error{};
};

/// A decreasing balance is an accounting failure; the delta must reach the
/// inclusive minimum (and be non-zero when `require_positive`).
status_t verify_delta(const delta_check_t& check);

}  // namespace raceswap::execution
