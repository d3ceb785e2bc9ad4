#pragma once

#include <raceswap/runtime/host.hpp>
#include <raceswap/schema/instruction.hpp>
#include <raceswap/schema/primitives.hpp>

#include <cstdint>

// Builtin token program. The same implementation serves the legacy and the
// 2022 program ids; each only moves accounts its own id owns.
namespace raceswap::runtime {

inline constexpr auto kTokenTransferTag = uint8_t{3};
inline constexpr auto kTokenTransferCheckedTag = uint8_t{12};

const raceswap::schema::pubkey_t& token_program_id();
const raceswap::schema::pubkey_t& token_2022_program_id();
bool is_token_program(const raceswap::schema::pubkey_t& program_id);

/// Accounts: [source, destination, authority].
raceswap::schema::instruction_t make_token_transfer_instruction(
    const raceswap::schema::pubkey_t& program_id,
    const raceswap::schema::pubkey_t& source,
    const raceswap::schema::pubkey_t& destination,
    const raceswap::schema::pubkey_t& authority,
    uint64_t amount);

/// Accounts: [source, mint, destination, authority].
raceswap::schema::instruction_t make_transfer_checked_instruction(
    const raceswap::schema::pubkey_t& program_id,
    const raceswap::schema::pubkey_t& source,
    const raceswap::schema::pubkey_t& mint,
    const raceswap::schema::pubkey_t& destination,
    const raceswap::schema::pubkey_t& authority,
    uint64_t amount,
    uint8_t decimals);

class token_program final : public program {
 public:
  raceswap::schema::transaction_result_t process(
      host& host,
      const invocation_t& invocation) override;

 private:
  struct transfer_accounts_t final {
    const raceswap::schema::account_info_t* source{};
    const raceswap::schema::account_info_t* mint{};
    const raceswap::schema::account_info_t* destination{};
    const raceswap::schema::account_info_t* authority{};
  };

  raceswap::schema::transaction_result_t transfer(
      host& host,
      const invocation_t& invocation,
      const transfer_accounts_t& accounts,
      uint64_t amount,
      std::optional<uint8_t> expected_decimals);
};

}  // namespace raceswap::runtime
