#include <raceswap/execution/program_config.hpp>
#include <raceswap/runtime/system_program.hpp>
#include <raceswap/runtime/token_program.hpp>

namespace raceswap::execution {

program_config make_mainnet_program_config() {
  return program_config{
      .program_id = raceswap::schema::make_pubkey(
          "Cy63SzwBBCP5ywaByjUrLuUXQ4pXP9nR7e7kdQqp5uLk"),
      .aggregator_program = raceswap::schema::make_pubkey(
          "JUP6LkbZbjS1jKKwapdHNy74zcZ3tLUZoi5QNyVTaV4"),
      .treasury = raceswap::schema::make_pubkey(
          "Exh4ZxgzA32hnLrQq3UnqxEXMRd4vifogMc6oXn7bP4L"),
      .system_program = raceswap::runtime::system_program_id(),
      .token_program = raceswap::runtime::token_program_id(),
      .token_2022_program = raceswap::runtime::token_2022_program_id(),
      .direct_treasury_fee_bps = kDirectTreasuryFeeBps};
}

}  // namespace raceswap::execution
