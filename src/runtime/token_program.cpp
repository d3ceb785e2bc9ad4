#include <raceswap/runtime/token_program.hpp>
#include <raceswap/schema/encoding/borsh/reader.hpp>
#include <raceswap/schema/encoding/borsh/writer.hpp>
#include <raceswap/schema/token/mint.hpp>
#include <raceswap/schema/token/token_account.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <limits>

using namespace raceswap::schema;

namespace raceswap::runtime {

using raceswap::schema::to_string;

namespace {

std::optional<token::token_account_t> load_token_account(
    const host& host,
    const pubkey_t& program_id,
    const pubkey_t& key) {
  auto account = host.load(key);
  if (!account || account->owner != program_id) {
    return std::nullopt;
  }
  return token::try_decode_token_account(account->data);
}

transaction_result_t store_token_account(host& host,
                                         const pubkey_t& key,
                                         const token::token_account_t& state) {
  auto account = host.load(key);
  if (!account) {
    return make_runtime_error(runtime_error_code::invalid_account_data,
                              to_string(key));
  }
  // Keep any extension bytes past the base record.
  auto encoded = token::encode_token_account(state);
  std::copy(std::begin(encoded), std::end(encoded),
            std::begin(account->data));
  return host.store(key, *account);
}

}  // namespace

const pubkey_t& token_program_id() {
  static const auto id =
      make_pubkey("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
  return id;
}

const pubkey_t& token_2022_program_id() {
  static const auto id =
      make_pubkey("TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb");
  return id;
}

bool is_token_program(const pubkey_t& program_id) {
  return program_id == token_program_id() ||
         program_id == token_2022_program_id();
}

instruction_t make_token_transfer_instruction(const pubkey_t& program_id,
                                              const pubkey_t& source,
                                              const pubkey_t& destination,
                                              const pubkey_t& authority,
                                              const uint64_t amount) {
  auto data = bytes_t{};
  auto w = encoding::borsh::writer{data};
  w.write(kTokenTransferTag);
  w.write(amount);
  return instruction_t{
      .program_id = program_id,
      .accounts = {account_meta_t{.pubkey = source, .is_writable = true},
                   account_meta_t{.pubkey = destination, .is_writable = true},
                   account_meta_t{.pubkey = authority, .is_signer = true}},
      .data = std::move(data)};
}

instruction_t make_transfer_checked_instruction(const pubkey_t& program_id,
                                                const pubkey_t& source,
                                                const pubkey_t& mint,
                                                const pubkey_t& destination,
                                                const pubkey_t& authority,
                                                const uint64_t amount,
                                                const uint8_t decimals) {
  auto data = bytes_t{};
  auto w = encoding::borsh::writer{data};
  w.write(kTokenTransferCheckedTag);
  w.write(amount);
  w.write(decimals);
  return instruction_t{
      .program_id = program_id,
      .accounts = {account_meta_t{.pubkey = source, .is_writable = true},
                   account_meta_t{.pubkey = mint},
                   account_meta_t{.pubkey = destination, .is_writable = true},
                   account_meta_t{.pubkey = authority, .is_signer = true}},
      .data = std::move(data)};
}

transaction_result_t token_program::process(host& host,
                                            const invocation_t& invocation) {
  auto r = encoding::borsh::reader{invocation.data};
  auto tag = uint8_t{};
  auto amount = uint64_t{};
  if (!r.read(tag) || !r.read(amount)) {
    return make_runtime_error(runtime_error_code::invalid_instruction_data,
                              "malformed token instruction");
  }
  const auto& accounts = invocation.accounts;
  switch (tag) {
    case kTokenTransferTag:
      if (!r.exhausted()) {
        return make_runtime_error(runtime_error_code::invalid_instruction_data,
                                  "malformed transfer");
      }
      if (accounts.size() < 3) {
        return make_runtime_error(runtime_error_code::account_not_provided,
                                  "transfer needs [source, destination, "
                                  "authority]");
      }
      return transfer(host, invocation,
                      transfer_accounts_t{.source = &accounts[0],
                                          .destination = &accounts[1],
                                          .authority = &accounts[2]},
                      amount, std::nullopt);
    case kTokenTransferCheckedTag: {
      auto decimals = uint8_t{};
      if (!r.read(decimals) || !r.exhausted()) {
        return make_runtime_error(runtime_error_code::invalid_instruction_data,
                                  "malformed transfer_checked");
      }
      if (accounts.size() < 4) {
        return make_runtime_error(runtime_error_code::account_not_provided,
                                  "transfer_checked needs [source, mint, "
                                  "destination, authority]");
      }
      return transfer(host, invocation,
                      transfer_accounts_t{.source = &accounts[0],
                                          .mint = &accounts[1],
                                          .destination = &accounts[2],
                                          .authority = &accounts[3]},
                      amount, decimals);
    }
    default:
      return make_runtime_error(
          runtime_error_code::invalid_instruction_data,
          fmt::format("unsupported token instruction {}", tag));
  }
}

transaction_result_t token_program::transfer(
    host& host,
    const invocation_t& invocation,
    const transfer_accounts_t& accounts,
    const uint64_t amount,
    const std::optional<uint8_t> expected_decimals) {
  const auto& program_id = invocation.program_id;
  auto source = load_token_account(host, program_id, accounts.source->key);
  auto destination =
      load_token_account(host, program_id, accounts.destination->key);
  if (!source || !destination) {
    return make_runtime_error(runtime_error_code::invalid_account_data,
                              "source or destination is not a token account "
                              "of this program");
  }
  if (source->mint != destination->mint) {
    return make_runtime_error(runtime_error_code::mint_mismatch);
  }
  if (source->state == token::account_state_t::frozen ||
      destination->state == token::account_state_t::frozen) {
    return make_runtime_error(runtime_error_code::account_frozen);
  }

  if (expected_decimals) {
    if (accounts.mint->key != source->mint) {
      return make_runtime_error(runtime_error_code::mint_mismatch);
    }
    auto mint_account = host.load(accounts.mint->key);
    if (!mint_account || mint_account->owner != program_id) {
      return make_runtime_error(runtime_error_code::invalid_account_data,
                                "mint is not owned by this program");
    }
    auto mint = token::try_decode_mint(mint_account->data);
    if (!mint) {
      return make_runtime_error(runtime_error_code::invalid_account_data,
                                "malformed mint");
    }
    if (mint->decimals != *expected_decimals) {
      return make_runtime_error(
          runtime_error_code::invalid_instruction_data,
          fmt::format("mint has {} decimals, instruction says {}",
                      mint->decimals, *expected_decimals));
    }
  }

  const auto& authority = *accounts.authority;
  const auto by_delegate = authority.key != source->owner;
  if (by_delegate &&
      !(source->delegate && authority.key == *source->delegate &&
        source->delegated_amount >= amount)) {
    return make_runtime_error(runtime_error_code::owner_mismatch,
                              to_string(authority.key));
  }
  if (!authority.is_signer) {
    return make_runtime_error(runtime_error_code::missing_signature,
                              to_string(authority.key));
  }
  if (source->amount < amount) {
    return make_runtime_error(
        runtime_error_code::insufficient_funds,
        fmt::format("need {} tokens, have {}", amount, source->amount));
  }
  if (accounts.source->key == accounts.destination->key) {
    return {};
  }
  if (amount > std::numeric_limits<uint64_t>::max() - destination->amount) {
    return make_runtime_error(
        runtime_error_code::arithmetic_overflow,
        fmt::format("destination {} holds {}, cannot add {}",
                    to_string(accounts.destination->key), destination->amount,
                    amount));
  }

  source->amount -= amount;
  if (by_delegate) {
    source->delegated_amount -= amount;
  }
  destination->amount += amount;
  if (auto stored = store_token_account(host, accounts.source->key, *source);
      !stored.ok()) {
    return stored;
  }
  if (auto stored = store_token_account(host, accounts.destination->key,
                                        *destination);
      !stored.ok()) {
    return stored;
  }
  spdlog::debug("token: moved {} of {} {} -> {}", amount,
                to_string(source->mint), to_string(accounts.source->key),
                to_string(accounts.destination->key));
  return {};
}

}  // namespace raceswap::runtime
