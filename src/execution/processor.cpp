#include <raceswap/common/critical.hpp>
#include <raceswap/execution/account_source.hpp>
#include <raceswap/execution/balance_verifier.hpp>
#include <raceswap/execution/dispatcher.hpp>
#include <raceswap/execution/fee.hpp>
#include <raceswap/execution/permission_reconciler.hpp>
#include <raceswap/execution/processor.hpp>
#include <raceswap/runtime/system_program.hpp>
#include <raceswap/runtime/token_program.hpp>
#include <raceswap/schema/program_instruction.hpp>
#include <raceswap/schema/token/mint.hpp>
#include <raceswap/schema/token/token_account.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <variant>

using namespace raceswap::schema;

namespace {

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             const bool index = false) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

transaction_event_t make_config_updated_event(const fee_config_t& config) {
  return transaction_event_t{
      .type = "config_updated",
      .attributes = {
          make_attribute("authority", to_string(config.authority), true),
          make_attribute("treasury_wallet", to_string(config.treasury_wallet)),
          make_attribute("reflection_fee_bps",
                         std::to_string(config.reflection_fee_bps)),
          make_attribute("treasury_fee_bps",
                         std::to_string(config.treasury_fee_bps))}};
}

transaction_event_t make_swap_executed_event(const swap_executed_t& swap) {
  return transaction_event_t{
      .type = "swap_executed",
      .attributes = {
          make_attribute("user", to_string(swap.user), true),
          make_attribute("input_mint", to_string(swap.input_mint), true),
          make_attribute("main_output_mint", to_string(swap.main_output_mint)),
          make_attribute("reflection_output_mint",
                         to_string(swap.reflection_output_mint)),
          make_attribute("total_in", std::to_string(swap.total_in)),
          make_attribute("main_amount", std::to_string(swap.main_amount)),
          make_attribute("reflection_amount",
                         std::to_string(swap.reflection_amount)),
          make_attribute("treasury_amount",
                         std::to_string(swap.treasury_amount))}};
}

config_updated_t to_config_updated(const fee_config_t& config) {
  return config_updated_t{.authority = config.authority,
                          .treasury_wallet = config.treasury_wallet,
                          .reflection_fee_bps = config.reflection_fee_bps,
                          .treasury_fee_bps = config.treasury_fee_bps};
}

transaction_result_t config_updated_result(const fee_config_t& config,
                                           std::string info) {
  auto result = transaction_result_t{};
  result.data = encode_event(to_config_updated(config));
  result.info = std::move(info);
  result.events.push_back(make_config_updated_event(config));
  return result;
}

transaction_result_t not_enough_accounts(const std::size_t expected,
                                         const std::size_t provided) {
  return raceswap::execution::make_result(raceswap::execution::fail(
      swap_error_code::account_mismatch,
      fmt::format("expected at least {} accounts, got {}", expected,
                  provided)));
}

std::optional<token::token_account_t> decode_token_account(
    const account_info_t& info) {
  return token::try_decode_token_account(info.account.data);
}

}  // namespace

namespace raceswap::execution {

processor::processor(const program_config& config,
                     const engine_options& options)
    : config_{config}, options_{options} {}

transaction_result_t processor::process(
    raceswap::runtime::host& host,
    const raceswap::runtime::invocation_t& invocation) {
  if (invocation.program_id != config_.program_id) {
    return make_result(fail(swap_error_code::invalid_program_account,
                            "invoked under a foreign program id"));
  }
  auto decoded = try_decode_instruction(invocation.data,
                                        options_.account_encoding);
  if (!decoded) {
    spdlog::warn("Rejecting undecodable instruction ({} bytes)",
                 invocation.data.size());
    return make_result(fail(swap_error_code::invalid_instruction));
  }

  const auto wrong_mode = [&](const std::string_view instruction) {
    return make_result(fail(
        swap_error_code::invalid_account_encoding,
        fmt::format("{} is not accepted in {} mode", instruction,
                    to_string(options_.authority_mode))));
  };

  return std::visit(
      overloaded{
          [&](const initialize_config_t& params) {
            return initialize_config(host, invocation, params);
          },
          [&](const update_config_t& params) {
            return update_config(host, invocation, params);
          },
          [&](const execute_raceswap_t& params) {
            if (options_.authority_mode != authority_mode_t::derived) {
              return wrong_mode(kExecuteRaceswapName);
            }
            return execute_raceswap(host, invocation, params);
          },
          [&](const execute_swap_t& params) {
            if (options_.authority_mode != authority_mode_t::direct) {
              return wrong_mode(kExecuteSwapName);
            }
            return execute_swap(host, invocation, params);
          },
          [&](const execute_swap_indexed_t& params) {
            if (options_.authority_mode != authority_mode_t::direct) {
              return wrong_mode(kExecuteSwapName);
            }
            return execute_swap(host, invocation, params);
          }},
      *decoded);
}

transaction_result_t processor::initialize_config(
    raceswap::runtime::host& host,
    const raceswap::runtime::invocation_t& invocation,
    const initialize_config_t& params) {
  if (invocation.accounts.size() < kInitializeConfigAccounts) {
    return not_enough_accounts(kInitializeConfigAccounts,
                               invocation.accounts.size());
  }
  const auto& config_account = invocation.accounts[0];
  const auto& payer = invocation.accounts[1];
  const auto& system_program = invocation.accounts[2];
  host.log("Instruction: InitializeConfig");

  if (!valid_fee_rates(params.reflection_fee_bps, params.treasury_fee_bps)) {
    return make_result(fail(
        swap_error_code::invalid_fee_config,
        fmt::format("reflection {} bps, treasury {} bps",
                    params.reflection_fee_bps, params.treasury_fee_bps)));
  }
  if (system_program.key != config_.system_program) {
    return make_result(fail(swap_error_code::invalid_program_account,
                            to_string(system_program.key)));
  }
  if (!payer.is_signer) {
    return make_result(
        fail(swap_error_code::missing_signature, to_string(payer.key)));
  }
  auto config_address = find_config_address(config_.program_id);
  if (!config_address || config_address->address != config_account.key) {
    return make_result(fail(swap_error_code::config_missing,
                            "config is not the derived config address"));
  }
  if (auto existing = host.load(config_account.key);
      existing && (existing->owner == config_.program_id ||
                   !existing->data.empty())) {
    return make_result(fail(swap_error_code::config_already_initialized));
  }
  auto authority =
      derived_authority::derive(config_account.key, config_.program_id);
  if (!authority) {
    raceswap::common::critical("no off-curve authority address for config");
  }

  auto create = raceswap::runtime::make_create_account_instruction(
      payer.key, config_account.key,
      raceswap::runtime::rent_exempt_minimum(kConfigAccountSize),
      kConfigAccountSize, config_.program_id);
  create.program_id = config_.system_program;
  auto config_seeds =
      seeds_t{make_bytes(kConfigSeed), bytes_t{config_address->bump}};
  if (auto created = host.invoke(create, signer_seeds_t{config_seeds});
      !created.ok()) {
    return created;
  }

  auto stored = fee_config_t{.authority = params.authority,
                             .treasury_wallet = params.treasury_wallet,
                             .reflection_fee_bps = params.reflection_fee_bps,
                             .treasury_fee_bps = params.treasury_fee_bps,
                             .bump = config_address->bump,
                             .authority_bump = authority->bump()};
  auto account = host.load(config_account.key);
  if (!account) {
    raceswap::common::critical("config account vanished after creation");
  }
  account->data = encode_config_account(stored);
  if (auto written = host.store(config_account.key, *account); !written.ok()) {
    return written;
  }

  spdlog::info("Initialized config {} with authority {}",
               to_string(config_account.key), to_string(stored.authority));
  return config_updated_result(stored, "initialize_config accepted");
}

transaction_result_t processor::update_config(
    raceswap::runtime::host& host,
    const raceswap::runtime::invocation_t& invocation,
    const update_config_t& params) {
  if (invocation.accounts.size() < kUpdateConfigAccounts) {
    return not_enough_accounts(kUpdateConfigAccounts,
                               invocation.accounts.size());
  }
  const auto& config_account = invocation.accounts[0];
  const auto& authority = invocation.accounts[1];
  host.log("Instruction: UpdateConfig");

  auto current = load_config(config_account);
  if (!current) {
    return make_result(fail(swap_error_code::config_missing));
  }
  if (authority.key != current->authority) {
    spdlog::warn("Config update by {} refused", to_string(authority.key));
    return make_result(
        fail(swap_error_code::unauthorized, to_string(authority.key)));
  }
  if (!authority.is_signer) {
    return make_result(
        fail(swap_error_code::missing_signature, to_string(authority.key)));
  }

  auto updated = *current;
  if (params.new_authority) {
    updated.authority = *params.new_authority;
  }
  if (params.treasury_wallet) {
    updated.treasury_wallet = *params.treasury_wallet;
  }
  if (params.reflection_fee_bps) {
    updated.reflection_fee_bps = *params.reflection_fee_bps;
  }
  if (params.treasury_fee_bps) {
    updated.treasury_fee_bps = *params.treasury_fee_bps;
  }
  if (!valid_fee_rates(updated.reflection_fee_bps, updated.treasury_fee_bps)) {
    return make_result(fail(
        swap_error_code::invalid_fee_config,
        fmt::format("reflection {} bps, treasury {} bps",
                    updated.reflection_fee_bps, updated.treasury_fee_bps)));
  }

  auto account = host.load(config_account.key);
  if (!account) {
    return make_result(fail(swap_error_code::config_missing));
  }
  auto encoded = encode_config_account(updated);
  if (account->data.size() < encoded.size()) {
    account->data.resize(encoded.size());
  }
  std::copy(std::begin(encoded), std::end(encoded),
            std::begin(account->data));
  if (auto written = host.store(config_account.key, *account); !written.ok()) {
    return written;
  }

  spdlog::info("Updated config {}", to_string(config_account.key));
  return config_updated_result(updated, "update_config accepted");
}

template <typename Request>
transaction_result_t processor::execute_swap(
    raceswap::runtime::host& host,
    const raceswap::runtime::invocation_t& invocation,
    const Request& params) {
  if (invocation.accounts.size() < kExecuteSwapAccounts) {
    return not_enough_accounts(kExecuteSwapAccounts,
                               invocation.accounts.size());
  }
  const auto& user = invocation.accounts[0];
  const auto& treasury = invocation.accounts[1];
  const auto& aggregator = invocation.accounts[2];
  const auto& system_program = invocation.accounts[3];
  host.log(fmt::format("ExecuteSwap: amount={}, min_out={}", params.amount,
                       params.min_out));

  if (!user.is_signer) {
    return make_result(
        fail(swap_error_code::missing_signature, to_string(user.key)));
  }
  if (treasury.key != config_.treasury) {
    return make_result(fail(swap_error_code::invalid_treasury_account,
                            to_string(treasury.key)));
  }
  if (aggregator.key != config_.aggregator_program ||
      system_program.key != config_.system_program) {
    return make_result(fail(swap_error_code::invalid_program_account));
  }
  if (params.amount == 0) {
    return make_result(fail(swap_error_code::invalid_amount));
  }

  auto forwarded = std::span{invocation.accounts}.subspan(kExecuteSwapAccounts);
  auto resolved = std::vector<resolved_account_t>{};
  if (auto failure = resolve_accounts(params.accounts, forwarded, resolved);
      failure) {
    return make_result(*failure);
  }

  auto fee = compute_fee(params.amount, config_.direct_treasury_fee_bps);
  if (!fee) {
    return make_result(fail(swap_error_code::math_overflow));
  }
  if (auto failure = collect_treasury_fee(host, config_.system_program,
                                          user.key, treasury.key, *fee);
      failure) {
    return make_result(*failure);
  }

  auto forwarder = dispatcher{host, config_.aggregator_program};
  if (auto failure = forwarder.dispatch(reconcile(resolved), params.data);
      failure) {
    return make_result(*failure);
  }

  spdlog::info("Direct swap by {}: {} in, {} lamports fee",
               to_string(user.key), params.amount, *fee);
  auto result = transaction_result_t{};
  result.info = "execute_swap accepted";
  return result;
}

transaction_result_t processor::execute_raceswap(
    raceswap::runtime::host& host,
    const raceswap::runtime::invocation_t& invocation,
    const execute_raceswap_t& params) {
  if (invocation.accounts.size() < kExecuteRaceswapAccounts) {
    return not_enough_accounts(kExecuteRaceswapAccounts,
                               invocation.accounts.size());
  }
  const auto& config_account = invocation.accounts[0];
  const auto& user = invocation.accounts[1];
  const auto& input_mint = invocation.accounts[2];
  const auto& user_input = invocation.accounts[3];
  const auto& main_destination = invocation.accounts[4];
  const auto& reflection_destination = invocation.accounts[5];
  const auto& treasury_wallet = invocation.accounts[6];
  const auto& treasury_fee_destination = invocation.accounts[7];
  const auto& input_vault = invocation.accounts[8];
  const auto& input_token_program = invocation.accounts[9];
  const auto& aggregator = invocation.accounts[10];
  const auto& system_program = invocation.accounts[11];
  host.log(fmt::format(
      "ExecuteRaceswap: total_in={}, min_main={}, min_refl={}, "
      "disable_refl={}",
      params.total_input_amount, params.min_main_out,
      params.min_reflection_out, params.disable_reflection));

  if (!user.is_signer) {
    return make_result(
        fail(swap_error_code::missing_signature, to_string(user.key)));
  }
  auto config = load_config(config_account);
  if (!config) {
    return make_result(fail(swap_error_code::config_missing));
  }
  auto authority = derived_authority::from_bump(
      config_account.key, config->authority_bump, config_.program_id);
  if (!authority) {
    return make_result(fail(swap_error_code::config_missing,
                            "stored authority bump is not valid"));
  }
  if (params.total_input_amount == 0) {
    return make_result(fail(swap_error_code::invalid_amount));
  }

  if (!is_token_program(input_token_program.key) ||
      aggregator.key != config_.aggregator_program ||
      system_program.key != config_.system_program) {
    return make_result(fail(swap_error_code::invalid_program_account));
  }
  if (input_mint.account.owner != input_token_program.key) {
    return make_result(fail(
        swap_error_code::invalid_input_mint_owner,
        fmt::format("expected {}", to_string(input_token_program.key))));
  }
  auto mint = token::try_decode_mint(input_mint.account.data);
  if (!mint || input_mint.key != params.input_mint) {
    return make_result(
        fail(swap_error_code::invalid_input_mint, to_string(input_mint.key)));
  }

  auto vault = decode_token_account(input_vault);
  if (!vault) {
    return make_result(fail(swap_error_code::invalid_vault_owner,
                            "vault is not a token account"));
  }
  if (auto failure = verify_vault(*vault, *authority, params.input_mint);
      failure) {
    return make_result(*failure);
  }

  if (treasury_wallet.key != config_.treasury ||
      treasury_fee_destination.key != config->treasury_wallet) {
    return make_result(fail(swap_error_code::invalid_treasury_account));
  }
  if (static_cast<uint32_t>(config->reflection_fee_bps) +
          config->treasury_fee_bps >=
      kFeeDenominator) {
    return make_result(fail(swap_error_code::invalid_fee_config));
  }

  if (auto failure = verify_destination(main_destination,
                                        params.main_output_mint, user.key,
                                        swap_error_code::invalid_main_account);
      failure) {
    return make_result(*failure);
  }
  auto source = decode_token_account(user_input);
  if (!source || source->mint != params.input_mint ||
      source->owner != user.key) {
    return make_result(
        fail(swap_error_code::invalid_user_source, to_string(user_input.key)));
  }

  auto reflection_amount = uint64_t{};
  if (!params.disable_reflection) {
    auto computed =
        compute_fee(params.total_input_amount, config->reflection_fee_bps);
    if (!computed) {
      return make_result(fail(swap_error_code::math_overflow));
    }
    reflection_amount = *computed;
  }
  const auto reflection_required = reflection_amount > 0;
  if (reflection_required) {
    if (auto failure = verify_destination(
            reflection_destination, params.reflection_mint, user.key,
            swap_error_code::invalid_reflection_account);
        failure) {
      return make_result(*failure);
    }
    if (!params.reflection_leg) {
      return make_result(fail(swap_error_code::missing_reflection_leg));
    }
  } else if (params.reflection_leg) {
    return make_result(fail(swap_error_code::unexpected_reflection_leg));
  }
  if (!params.main_leg) {
    return make_result(fail(swap_error_code::missing_main_leg));
  }

  auto treasury_fee =
      compute_fee(params.total_input_amount, config->treasury_fee_bps);
  if (!treasury_fee) {
    return make_result(fail(swap_error_code::math_overflow));
  }
  spdlog::debug("Raceswap by {}: {} in, reflection {}, treasury fee {}",
                to_string(user.key), params.total_input_amount,
                reflection_amount, *treasury_fee);

  if (auto failure =
          collect_treasury_fee(host, config_.system_program, user.key,
                               treasury_fee_destination.key, *treasury_fee);
      failure) {
    return make_result(*failure);
  }

  auto deposit = raceswap::runtime::make_transfer_checked_instruction(
      input_token_program.key, user_input.key, input_mint.key, input_vault.key,
      user.key, params.total_input_amount, mint->decimals);
  if (auto deposited = host.invoke(deposit, {}); !deposited.ok()) {
    return make_result(
        fail(swap_error_code::input_transfer_failed,
             fmt::format("{}: {}", deposited.log, deposited.info)));
  }
  spdlog::debug("Moved {} into vault {}", params.total_input_amount,
                to_string(input_vault.key));

  auto cursor = account_cursor{
      std::span{invocation.accounts}.subspan(kExecuteRaceswapAccounts)};
  auto forwarder = dispatcher{host, config_.aggregator_program};

  // Legs share the cursor; each balance is re-read from the host after its
  // call.
  const auto run_leg = [&](const serialized_instruction_t& leg,
                           const pubkey_t& destination,
                           delta_check_t check,
                           uint64_t& received) -> status_t {
    auto before = read_token_balance(host, destination);
    if (!before) {
      return fail(check.accounting_error, to_string(destination));
    }
    if (auto failure = forwarder.dispatch_leg(leg, cursor, authority);
        failure) {
      return failure;
    }
    auto after = read_token_balance(host, destination);
    if (!after) {
      return fail(check.accounting_error, to_string(destination));
    }
    check.before = *before;
    check.after = *after;
    if (auto failure = verify_delta(check); failure) {
      return failure;
    }
    received = check.after - check.before;
    return std::nullopt;
  };

  auto reflection_received = uint64_t{};
  if (reflection_required) {
    if (auto failure = run_leg(
            *params.reflection_leg, reflection_destination.key,
            delta_check_t{
                .minimum = params.min_reflection_out,
                .require_positive = true,
                .accounting_error =
                    swap_error_code::invalid_reflection_accounting,
                .below_minimum_error =
                    swap_error_code::reflection_below_min_out},
            reflection_received);
        failure) {
      return make_result(*failure);
    }
  }

  auto main_received = uint64_t{};
  if (auto failure = run_leg(
          *params.main_leg, main_destination.key,
          delta_check_t{
              .minimum = params.min_main_out,
              .accounting_error = swap_error_code::invalid_main_accounting,
              .below_minimum_error = swap_error_code::main_below_min_out},
          main_received);
      failure) {
    return make_result(*failure);
  }

  if (!cursor.exhausted()) {
    return make_result(
        fail(swap_error_code::account_mismatch,
             fmt::format("{} trailing account(s)", cursor.remaining())));
  }

  auto swap = swap_executed_t{.user = user.key,
                              .input_mint = params.input_mint,
                              .main_output_mint = params.main_output_mint,
                              .reflection_output_mint = params.reflection_mint,
                              .total_in = params.total_input_amount,
                              .main_amount = main_received,
                              .reflection_amount = reflection_received,
                              .treasury_amount = *treasury_fee};
  spdlog::info("Raceswap by {}: main {} reflection {}", to_string(user.key),
               main_received, reflection_received);

  auto result = transaction_result_t{};
  result.data = encode_event(swap);
  result.info = "execute_raceswap accepted";
  result.events.push_back(make_swap_executed_event(swap));
  return result;
}

std::optional<fee_config_t> processor::load_config(
    const account_info_t& account) const {
  auto address = find_config_address(config_.program_id);
  if (!address || address->address != account.key ||
      account.account.owner != config_.program_id) {
    return std::nullopt;
  }
  return try_decode_config_account(account.account.data);
}

bool processor::is_token_program(const pubkey_t& key) const {
  return key == config_.token_program || key == config_.token_2022_program;
}

status_t processor::verify_destination(const account_info_t& account,
                                       const pubkey_t& mint,
                                       const pubkey_t& user,
                                       const swap_error_code error) const {
  if (!is_token_program(account.account.owner)) {
    return fail(error, fmt::format("{} is not held by a token program",
                                   to_string(account.key)));
  }
  auto decoded = decode_token_account(account);
  if (!decoded) {
    return fail(error, fmt::format("{} is not a token account",
                                   to_string(account.key)));
  }
  if (decoded->mint != mint || decoded->owner != user) {
    return fail(error, fmt::format("{} has mint {} and owner {}",
                                   to_string(account.key),
                                   to_string(decoded->mint),
                                   to_string(decoded->owner)));
  }
  return std::nullopt;
}

}  // namespace raceswap::execution
