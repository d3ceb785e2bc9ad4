#include <boost/program_options.hpp>
#include <raceswap/common/critical.hpp>
#include <raceswap/execution/processor.hpp>
#include <raceswap/execution/program_config.hpp>
#include <raceswap/execution/vault_authority.hpp>
#include <raceswap/runtime/ledger.hpp>
#include <raceswap/runtime/system_program.hpp>
#include <raceswap/schema/encoding/scale/encoder.hpp>
#include <raceswap/schema/program_instruction.hpp>
#include <raceswap/storage/rocksdb/storage.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace raceswap::schema;

void setup_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  // stdout carries command output; logs go to stderr and the file.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "raceswap", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

pubkey_t get_pubkey(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    raceswap::common::critical("missing required address --{}", name);
  }
  auto key = try_make_pubkey(vm[name].as<std::string>());
  if (!key) {
    raceswap::common::critical("--{} must be a base58 address", name);
  }
  return *key;
}

std::optional<pubkey_t> get_optional_pubkey(const po::variables_map& vm,
                                            const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return get_pubkey(vm, name);
}

std::optional<basis_points_t> get_optional_bps(const po::variables_map& vm,
                                               const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<basis_points_t>();
}

raceswap::execution::program_config make_program_config(
    const po::variables_map& vm) {
  auto config = raceswap::execution::make_mainnet_program_config();
  if (vm.contains("program-id")) {
    config.program_id = get_pubkey(vm, "program-id");
  }
  if (vm.contains("aggregator")) {
    config.aggregator_program = get_pubkey(vm, "aggregator");
  }
  return config;
}

account_encoding_t get_encoding(const po::variables_map& vm) {
  auto encoding =
      try_from_string<account_encoding_t>(vm["encoding"].as<std::string>());
  if (!encoding) {
    raceswap::common::critical("encoding must be one of {}",
                               join_names(kAccountEncodingMappings));
  }
  return *encoding;
}

pubkey_t config_address(const raceswap::execution::program_config& config) {
  auto address = raceswap::execution::find_config_address(config.program_id);
  if (!address) {
    raceswap::common::critical("no config address for program id");
  }
  return address->address;
}

void print_config(const fee_config_t& config) {
  std::cout << "authority: " << to_string(config.authority) << '\n'
            << "treasury_wallet: " << to_string(config.treasury_wallet) << '\n'
            << "reflection_fee_bps: " << config.reflection_fee_bps << '\n'
            << "treasury_fee_bps: " << config.treasury_fee_bps << '\n'
            << "bump: " << static_cast<uint32_t>(config.bump) << '\n'
            << "authority_bump: " << static_cast<uint32_t>(config.authority_bump)
            << '\n';
}

void print_leg(const std::string_view name,
               const std::optional<serialized_instruction_t>& leg) {
  if (!leg) {
    std::cout << name << ": none\n";
    return;
  }
  std::cout << name << ".accounts_len: " << leg->accounts_len << '\n'
            << name << ".data: " << to_hex(leg->data) << '\n';
  for (std::size_t i = 0; i < leg->is_writable.size() &&
                          i < leg->is_signer.size();
       ++i) {
    std::cout << name << ".account[" << i << "]: writable="
              << leg->is_writable[i] << " signer=" << leg->is_signer[i]
              << '\n';
  }
}

void print_instruction(const program_instruction_t& instruction) {
  std::visit(
      overloaded{
          [](const initialize_config_t& params) {
            std::cout << "instruction: " << kInitializeConfigName << '\n'
                      << "authority: " << to_string(params.authority) << '\n'
                      << "treasury_wallet: "
                      << to_string(params.treasury_wallet) << '\n'
                      << "reflection_fee_bps: " << params.reflection_fee_bps
                      << '\n'
                      << "treasury_fee_bps: " << params.treasury_fee_bps
                      << '\n';
          },
          [](const update_config_t& params) {
            std::cout << "instruction: " << kUpdateConfigName << '\n';
            if (params.new_authority) {
              std::cout << "new_authority: "
                        << to_string(*params.new_authority) << '\n';
            }
            if (params.treasury_wallet) {
              std::cout << "treasury_wallet: "
                        << to_string(*params.treasury_wallet) << '\n';
            }
            if (params.reflection_fee_bps) {
              std::cout << "reflection_fee_bps: "
                        << *params.reflection_fee_bps << '\n';
            }
            if (params.treasury_fee_bps) {
              std::cout << "treasury_fee_bps: " << *params.treasury_fee_bps
                        << '\n';
            }
          },
          [](const execute_raceswap_t& params) {
            std::cout << "instruction: " << kExecuteRaceswapName << '\n'
                      << "input_mint: " << to_string(params.input_mint) << '\n'
                      << "main_output_mint: "
                      << to_string(params.main_output_mint) << '\n'
                      << "reflection_mint: "
                      << to_string(params.reflection_mint) << '\n'
                      << "total_input_amount: " << params.total_input_amount
                      << '\n'
                      << "min_main_out: " << params.min_main_out << '\n'
                      << "min_reflection_out: " << params.min_reflection_out
                      << '\n'
                      << "disable_reflection: " << params.disable_reflection
                      << '\n';
            print_leg("main_leg", params.main_leg);
            print_leg("reflection_leg", params.reflection_leg);
          },
          [](const execute_swap_t& params) {
            std::cout << "instruction: " << kExecuteSwapName << '\n'
                      << "amount: " << params.amount << '\n'
                      << "min_out: " << params.min_out << '\n'
                      << "data: " << to_hex(params.data) << '\n';
            for (std::size_t i = 0; i < params.accounts.size(); ++i) {
              const auto& account = params.accounts[i];
              std::cout << "account[" << i << "]: " << to_string(account.pubkey)
                        << " signer=" << account.is_signer
                        << " writable=" << account.is_writable << '\n';
            }
          },
          [](const execute_swap_indexed_t& params) {
            std::cout << "instruction: " << kExecuteSwapName << '\n'
                      << "amount: " << params.amount << '\n'
                      << "min_out: " << params.min_out << '\n'
                      << "data: " << to_hex(params.data) << '\n';
            for (std::size_t i = 0; i < params.accounts.size(); ++i) {
              const auto& account = params.accounts[i];
              std::cout << "account[" << i
                        << "]: index=" << static_cast<uint32_t>(account.index)
                        << " writable=" << account.is_writable << '\n';
            }
          }},
      instruction);
}

int report(const transaction_result_t& result) {
  if (!result.ok()) {
    std::cout << "error: [" << result.codespace << ":" << result.code << "] "
              << result.log << '\n';
    if (!result.info.empty()) {
      std::cout << "info: " << result.info << '\n';
    }
    return 1;
  }
  for (const auto& event : result.events) {
    std::cout << "event: " << event.type << '\n';
    for (const auto& attribute : event.attributes) {
      std::cout << "  " << attribute.key << ": " << attribute.value << '\n';
    }
  }
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage: raceswap <command> [options]\n\n"
            << "Commands:\n"
            << "  derive          print config and authority addresses\n"
            << "  decode          decode hex instruction data\n"
            << "  init-config     create the config account in a ledger\n"
            << "  update-config   change config fields in a ledger\n"
            << "  show-config     print the stored config of a ledger\n\n"
            << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"raceswap options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "derive|decode|init-config|update-config|show-config")(
      "verbose,v", "debug logging")(
      "log-file", po::value<std::string>()->default_value("raceswap.log"),
      "log file path")("program-id", po::value<std::string>(),
                       "program id (base58), mainnet by default")(
      "aggregator", po::value<std::string>(),
      "aggregator program id (base58), mainnet by default")(
      "db-path", po::value<std::string>(), "ledger RocksDB directory")(
      "hex", po::value<std::string>(), "instruction data hex")(
      "encoding", po::value<std::string>()->default_value("full"),
      "full|indexed account references for execute_swap")(
      "payer", po::value<std::string>(), "payer address (base58)")(
      "fund", po::value<uint64_t>()->default_value(0),
      "lamports credited to the payer before init-config")(
      "authority", po::value<std::string>(), "config authority (base58)")(
      "new-authority", po::value<std::string>(),
      "replacement config authority (base58)")(
      "treasury-wallet", po::value<std::string>(),
      "treasury fee destination (base58)")(
      "reflection-bps", po::value<basis_points_t>(),
      "reflection fee in basis points")(
      "treasury-bps", po::value<basis_points_t>(),
      "treasury fee in basis points");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  setup_logging(vm["log-file"].as<std::string>(), vm.contains("verbose"));
  auto program_config = make_program_config(vm);

  if (command == "derive") {
    auto config = raceswap::execution::find_config_address(
        program_config.program_id);
    if (!config) {
      raceswap::common::critical("no config address for program id");
    }
    auto authority = raceswap::execution::derived_authority::derive(
        config->address, program_config.program_id);
    if (!authority) {
      raceswap::common::critical("no authority address for config");
    }
    std::cout << "program_id: " << to_string(program_config.program_id) << '\n'
              << "config: " << to_string(config->address) << '\n'
              << "config_bump: " << static_cast<uint32_t>(config->bump) << '\n'
              << "authority: " << to_string(authority->address()) << '\n'
              << "authority_bump: " << static_cast<uint32_t>(authority->bump())
              << '\n';
    spdlog::shutdown();
    return 0;
  }

  if (command == "decode") {
    if (!vm.contains("hex")) {
      raceswap::common::critical("decode requires --hex");
    }
    auto data = try_from_hex(vm["hex"].as<std::string>());
    if (!data) {
      raceswap::common::critical("--hex is not valid hex");
    }
    auto instruction = try_decode_instruction(
        bytes_view_t{data->data(), data->size()}, get_encoding(vm));
    if (!instruction) {
      std::cout << "error: " << to_string(swap_error_code::invalid_instruction)
                << '\n';
      spdlog::shutdown();
      return 1;
    }
    print_instruction(*instruction);
    spdlog::shutdown();
    return 0;
  }

  if (command != "init-config" && command != "update-config" &&
      command != "show-config") {
    raceswap::common::critical(
        "command must be derive|decode|init-config|update-config|show-config");
  }
  if (!vm.contains("db-path")) {
    raceswap::common::critical("ledger commands require --db-path");
  }

  auto encoder = raceswap::runtime::ledger::encoder_t{};
  auto storage =
      raceswap::storage::make_storage<raceswap::storage::rocksdb_storage_tag>(
          vm["db-path"].as<std::string>());
  auto ledger = raceswap::runtime::ledger{encoder, storage};
  ledger.register_program(
      program_config.program_id,
      std::make_shared<raceswap::execution::processor>(
          program_config, raceswap::execution::engine_options{}));
  auto config_key = config_address(program_config);

  auto exit_code = 0;
  if (command == "show-config") {
    auto account = ledger.account(config_key);
    auto config = account ? try_decode_config_account(account->data)
                          : std::nullopt;
    if (!config) {
      std::cout << "error: " << to_string(swap_error_code::config_missing)
                << '\n';
      exit_code = 1;
    } else {
      std::cout << "config: " << to_string(config_key) << '\n';
      print_config(*config);
    }
  } else if (command == "init-config") {
    auto payer = get_pubkey(vm, "payer");
    if (auto fund = vm["fund"].as<uint64_t>(); fund > 0) {
      ledger.set_account(
          payer, account_t{.owner = raceswap::runtime::system_program_id(),
                           .lamports = fund});
    }
    auto params = initialize_config_t{
        .authority = get_pubkey(vm, "authority"),
        .treasury_wallet = get_pubkey(vm, "treasury-wallet"),
        .reflection_fee_bps = get_optional_bps(vm, "reflection-bps").value_or(0),
        .treasury_fee_bps = get_optional_bps(vm, "treasury-bps").value_or(0)};
    auto transaction = raceswap::runtime::transaction_t{
        .signers = {payer},
        .instructions = {instruction_t{
            .program_id = program_config.program_id,
            .accounts = {account_meta_t{.pubkey = config_key,
                                        .is_writable = true},
                         account_meta_t{.pubkey = payer,
                                        .is_signer = true,
                                        .is_writable = true},
                         account_meta_t{
                             .pubkey = program_config.system_program}},
            .data = encode_instruction(params)}}};
    exit_code = report(ledger.execute(transaction));
  } else {
    auto authority = get_pubkey(vm, "authority");
    auto params = update_config_t{
        .new_authority = get_optional_pubkey(vm, "new-authority"),
        .treasury_wallet = get_optional_pubkey(vm, "treasury-wallet"),
        .reflection_fee_bps = get_optional_bps(vm, "reflection-bps"),
        .treasury_fee_bps = get_optional_bps(vm, "treasury-bps")};
    auto transaction = raceswap::runtime::transaction_t{
        .signers = {authority},
        .instructions = {instruction_t{
            .program_id = program_config.program_id,
            .accounts = {account_meta_t{.pubkey = config_key,
                                        .is_writable = true},
                         account_meta_t{.pubkey = authority,
                                        .is_signer = true}},
            .data = encode_instruction(params)}}};
    exit_code = report(ledger.execute(transaction));
  }

  spdlog::shutdown();
  return exit_code;
}
