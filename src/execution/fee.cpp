#include <raceswap/execution/fee.hpp>
#include <raceswap/runtime/system_program.hpp>
#include <raceswap/schema/fee_config.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <limits>

namespace mp = boost::multiprecision;

namespace raceswap::execution {

std::optional<uint64_t> compute_fee(
    const uint64_t amount,
    const raceswap::schema::basis_points_t bps) {
  auto product = mp::uint128_t{amount} * bps;
  auto fee = mp::uint128_t{product / raceswap::schema::kFeeDenominator};
  if (fee > std::numeric_limits<uint64_t>::max()) {
    return std::nullopt;
  }
  return fee.convert_to<uint64_t>();
}

bool valid_fee_rates(const raceswap::schema::basis_points_t reflection_fee_bps,
                     const raceswap::schema::basis_points_t treasury_fee_bps) {
  if (reflection_fee_bps > raceswap::schema::kMaxFeeBps ||
      treasury_fee_bps > raceswap::schema::kMaxFeeBps) {
    return false;
  }
  return static_cast<uint32_t>(reflection_fee_bps) + treasury_fee_bps <
         raceswap::schema::kFeeDenominator;
}

status_t collect_treasury_fee(raceswap::runtime::host& host,
                              const raceswap::schema::pubkey_t& system_program,
                              const raceswap::schema::pubkey_t& payer,
                              const raceswap::schema::pubkey_t& treasury,
                              const raceswap::schema::lamports_t lamports) {
  if (lamports == 0) {
    return std::nullopt;
  }
  auto instruction =
      raceswap::runtime::make_transfer_instruction(payer, treasury, lamports);
  instruction.program_id = system_program;
  auto result = host.invoke(instruction, {});
  if (!result.ok()) {
    return fail(raceswap::schema::swap_error_code::fee_transfer_failed,
                fmt::format("{}: {}", result.log, result.info));
  }
  spdlog::debug("Collected treasury fee of {} lamports", lamports);
  return std::nullopt;
}

}  // namespace raceswap::execution
