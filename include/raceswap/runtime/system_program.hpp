#pragma once

#include <raceswap/runtime/host.hpp>
#include <raceswap/schema/instruction.hpp>
#include <raceswap/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>

// Builtin native-currency program: account creation and transfers.
namespace raceswap::runtime {

inline constexpr auto kSystemCreateAccountTag = uint32_t{0};
inline constexpr auto kSystemTransferTag = uint32_t{2};

/// Largest data allocation `create_account` accepts.
inline constexpr auto kMaxAccountDataLength = uint64_t{10 * 1024 * 1024};

/// "11111111111111111111111111111111"
const raceswap::schema::pubkey_t& system_program_id();

/// Balance that keeps an account of `space` data bytes rent exempt.
constexpr raceswap::schema::lamports_t rent_exempt_minimum(
    const std::size_t space) {
  return static_cast<raceswap::schema::lamports_t>(128 + space) * 3'480 * 2;
}

raceswap::schema::instruction_t make_create_account_instruction(
    const raceswap::schema::pubkey_t& from,
    const raceswap::schema::pubkey_t& to,
    raceswap::schema::lamports_t lamports,
    uint64_t space,
    const raceswap::schema::pubkey_t& owner);

raceswap::schema::instruction_t make_transfer_instruction(
    const raceswap::schema::pubkey_t& from,
    const raceswap::schema::pubkey_t& to,
    raceswap::schema::lamports_t lamports);

class system_program final : public program {
 public:
  raceswap::schema::transaction_result_t process(
      host& host,
      const invocation_t& invocation) override;

 private:
  raceswap::schema::transaction_result_t create_account(
      host& host,
      const invocation_t& invocation,
      raceswap::schema::lamports_t lamports,
      uint64_t space,
      const raceswap::schema::pubkey_t& owner);

  raceswap::schema::transaction_result_t transfer(
      host& host,
      const invocation_t& invocation,
      raceswap::schema::lamports_t lamports);
};

}  // namespace raceswap::runtime
