#pragma once

#include <raceswap/execution/program_config.hpp>
#include <raceswap/execution/status.hpp>
#include <raceswap/execution/vault_authority.hpp>
#include <raceswap/runtime/host.hpp>
#include <raceswap/schema/account.hpp>
#include <raceswap/schema/execute_raceswap.hpp>
#include <raceswap/schema/execute_swap.hpp>
#include <raceswap/schema/fee_config.hpp>
#include <raceswap/schema/initialize_config.hpp>
#include <raceswap/schema/transaction_result.hpp>
#include <raceswap/schema/update_config.hpp>

#include <cstddef>
#include <optional>
#include <span>

namespace raceswap::execution {

/// Account order of `initialize_config`.
inline constexpr auto kInitializeConfigAccounts = std::size_t{3};
/// Account order of `update_config`: [config, authority].
inline constexpr auto kUpdateConfigAccounts = std::size_t{2};
/// Named accounts of `execute_swap`; the forwarded table follows.
inline constexpr auto kExecuteSwapAccounts = std::size_t{4};
/// Named accounts of `execute_raceswap`; leg accounts follow.
inline constexpr auto kExecuteRaceswapAccounts = std::size_t{12};

/// The swap-forwarding program.
///
/// One instance serves one `engine_options` pairing: in direct mode it
/// accepts `execute_swap` with accounts in the configured encoding, in
/// derived mode `execute_raceswap`. Config instructions are accepted in both.
/// A failed instruction returns a non-zero code and relies on the host to
/// discard its effects.
class processor final : public raceswap::runtime::program {
 public:
  processor(const program_config& config, const engine_options& options);

  raceswap::schema::transaction_result_t process(
      raceswap::runtime::host& host,
      const raceswap::runtime::invocation_t& invocation) override;

  const program_config& config() const { return config_; }
  const engine_options& options() const { return options_; }

 private:
  /// Accounts: [config, payer, system_program].
  raceswap::schema::transaction_result_t initialize_config(
      raceswap::runtime::host& host,
      const raceswap::runtime::invocation_t& invocation,
      const raceswap::schema::initialize_config_t& params);

  /// Accounts: [config, authority].
  raceswap::schema::transaction_result_t update_config(
      raceswap::runtime::host& host,
      const raceswap::runtime::invocation_t& invocation,
      const raceswap::schema::update_config_t& params);

  /// Accounts: [user, treasury, aggregator_program, system_program,
  /// forwarded...].
  template <typename Request>
  raceswap::schema::transaction_result_t execute_swap(
      raceswap::runtime::host& host,
      const raceswap::runtime::invocation_t& invocation,
      const Request& params);

  /// Accounts: [config, user, input_mint, user_input, user_main_destination,
  /// user_reflection_destination, treasury_wallet, treasury_fee_destination,
  /// input_vault, input_token_program, aggregator_program, system_program,
  /// leg accounts...].
  raceswap::schema::transaction_result_t execute_raceswap(
      raceswap::runtime::host& host,
      const raceswap::runtime::invocation_t& invocation,
      const raceswap::schema::execute_raceswap_t& params);

  /// The config account must sit at the derived config address, belong to
  /// this program and decode.
  std::optional<raceswap::schema::fee_config_t> load_config(
      const raceswap::schema::account_info_t& account) const;

  bool is_token_program(const raceswap::schema::pubkey_t& key) const;

  /// Decode a user destination and check its mint, its token owner and that
  /// a token program keeps it.
  status_t verify_destination(const raceswap::schema::account_info_t& account,
                              const raceswap::schema::pubkey_t& mint,
                              const raceswap::schema::pubkey_t& user,
                              raceswap::schema::swap_error_code error) const;

  program_config config_;
  engine_options options_;
};

}  // namespace raceswap::execution
