#pragma once

#include <raceswap/execution/status.hpp>
#include <raceswap/runtime/host.hpp>
#include <raceswap/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace raceswap::execution {

/// floor(amount * bps / 10000) over a 128-bit intermediate. Empty when the
/// result does not fit 64 bits, which needs bps above 10000.
std::optional<uint64_t> compute_fee(uint64_t amount,
                                    raceswap::schema::basis_points_t bps);

/// Each rate at most 1000 bps and together below the denominator.
bool valid_fee_rates(raceswap::schema::basis_points_t reflection_fee_bps,
                     raceswap::schema::basis_points_t treasury_fee_bps);

/// Native-currency transfer of `lamports` from `payer` to `treasury` through
/// the system program. A zero fee issues no transfer.
status_t collect_treasury_fee(raceswap::runtime::host& host,
                              const raceswap::schema::pubkey_t& system_program,
                              const raceswap::schema::pubkey_t& payer,
                              const raceswap::schema::pubkey_t& treasury,
                              raceswap::schema::lamports_t lamports);

}  // namespace raceswap::execution
