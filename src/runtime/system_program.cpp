#include <raceswap/runtime/system_program.hpp>
#include <raceswap/schema/encoding/borsh/reader.hpp>
#include <raceswap/schema/encoding/borsh/writer.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <limits>

using namespace raceswap::schema;

namespace raceswap::runtime {

using raceswap::schema::to_string;

namespace {

account_t empty_system_account() {
  return account_t{.owner = system_program_id()};
}

}  // namespace

const pubkey_t& system_program_id() {
  static const auto id = make_zero_pubkey();
  return id;
}

instruction_t make_create_account_instruction(const pubkey_t& from,
                                              const pubkey_t& to,
                                              const lamports_t lamports,
                                              const uint64_t space,
                                              const pubkey_t& owner) {
  auto data = bytes_t{};
  auto w = encoding::borsh::writer{data};
  w.write(kSystemCreateAccountTag);
  w.write(lamports);
  w.write(space);
  w.write(owner);
  return instruction_t{
      .program_id = system_program_id(),
      .accounts = {account_meta_t{
                       .pubkey = from, .is_signer = true, .is_writable = true},
                   account_meta_t{
                       .pubkey = to, .is_signer = true, .is_writable = true}},
      .data = std::move(data)};
}

instruction_t make_transfer_instruction(const pubkey_t& from,
                                        const pubkey_t& to,
                                        const lamports_t lamports) {
  auto data = bytes_t{};
  auto w = encoding::borsh::writer{data};
  w.write(kSystemTransferTag);
  w.write(lamports);
  return instruction_t{
      .program_id = system_program_id(),
      .accounts = {account_meta_t{
                       .pubkey = from, .is_signer = true, .is_writable = true},
                   account_meta_t{
                       .pubkey = to, .is_signer = false, .is_writable = true}},
      .data = std::move(data)};
}

transaction_result_t system_program::process(host& host,
                                             const invocation_t& invocation) {
  auto r = encoding::borsh::reader{invocation.data};
  auto tag = uint32_t{};
  if (!r.read(tag)) {
    return make_runtime_error(runtime_error_code::invalid_instruction_data,
                              "missing system instruction tag");
  }
  switch (tag) {
    case kSystemCreateAccountTag: {
      auto lamports = lamports_t{};
      auto space = uint64_t{};
      auto owner = pubkey_t{};
      if (!r.read(lamports) || !r.read(space) || !r.read(owner) ||
          !r.exhausted()) {
        return make_runtime_error(runtime_error_code::invalid_instruction_data,
                                  "malformed create_account");
      }
      return create_account(host, invocation, lamports, space, owner);
    }
    case kSystemTransferTag: {
      auto lamports = lamports_t{};
      if (!r.read(lamports) || !r.exhausted()) {
        return make_runtime_error(runtime_error_code::invalid_instruction_data,
                                  "malformed transfer");
      }
      return transfer(host, invocation, lamports);
    }
    default:
      return make_runtime_error(
          runtime_error_code::invalid_instruction_data,
          fmt::format("unsupported system instruction {}", tag));
  }
}

transaction_result_t system_program::create_account(
    host& host,
    const invocation_t& invocation,
    const lamports_t lamports,
    const uint64_t space,
    const pubkey_t& owner) {
  if (invocation.accounts.size() < 2) {
    return make_runtime_error(runtime_error_code::account_not_provided,
                              "create_account needs [from, to]");
  }
  if (space > kMaxAccountDataLength) {
    return make_runtime_error(
        runtime_error_code::invalid_instruction_data,
        fmt::format("space {} exceeds {}", space, kMaxAccountDataLength));
  }
  const auto& from_info = invocation.accounts[0];
  const auto& to_info = invocation.accounts[1];
  if (!from_info.is_signer || !to_info.is_signer) {
    return make_runtime_error(runtime_error_code::missing_signature,
                              "create_account needs both funder and new "
                              "account to sign");
  }

  auto existing = host.load(to_info.key);
  if (existing && (existing->lamports > 0 || !existing->data.empty() ||
                   existing->owner != system_program_id())) {
    return make_runtime_error(runtime_error_code::account_already_in_use,
                              to_string(to_info.key));
  }

  auto from = host.load(from_info.key).value_or(empty_system_account());
  if (!from.data.empty()) {
    return make_runtime_error(runtime_error_code::invalid_account_data,
                              "funding account carries data");
  }
  if (from.lamports < lamports) {
    return make_runtime_error(
        runtime_error_code::insufficient_funds,
        fmt::format("need {} lamports, have {}", lamports, from.lamports));
  }
  from.lamports -= lamports;
  if (auto stored = host.store(from_info.key, from); !stored.ok()) {
    return stored;
  }

  auto created = account_t{.owner = owner,
                           .lamports = lamports,
                           .data = bytes_t(static_cast<std::size_t>(space), 0)};
  if (auto stored = host.store(to_info.key, created); !stored.ok()) {
    return stored;
  }
  spdlog::debug("system: created {} ({} bytes) owned by {}",
                to_string(to_info.key), space, to_string(owner));
  return {};
}

transaction_result_t system_program::transfer(host& host,
                                              const invocation_t& invocation,
                                              const lamports_t lamports) {
  if (invocation.accounts.size() < 2) {
    return make_runtime_error(runtime_error_code::account_not_provided,
                              "transfer needs [from, to]");
  }
  const auto& from_info = invocation.accounts[0];
  const auto& to_info = invocation.accounts[1];
  if (!from_info.is_signer) {
    return make_runtime_error(runtime_error_code::missing_signature,
                              to_string(from_info.key));
  }

  auto from = host.load(from_info.key).value_or(empty_system_account());
  if (!from.data.empty()) {
    return make_runtime_error(runtime_error_code::invalid_account_data,
                              "transfer source carries data");
  }
  if (from.lamports < lamports) {
    return make_runtime_error(
        runtime_error_code::insufficient_funds,
        fmt::format("need {} lamports, have {}", lamports, from.lamports));
  }
  if (from_info.key == to_info.key) {
    return {};
  }
  auto to = host.load(to_info.key).value_or(empty_system_account());
  if (lamports > std::numeric_limits<lamports_t>::max() - to.lamports) {
    return make_runtime_error(
        runtime_error_code::arithmetic_overflow,
        fmt::format("{} holds {} lamports, cannot add {}",
                    to_string(to_info.key), to.lamports, lamports));
  }
  from.lamports -= lamports;
  if (auto stored = host.store(from_info.key, from); !stored.ok()) {
    return stored;
  }

  to.lamports += lamports;
  if (auto stored = host.store(to_info.key, to); !stored.ok()) {
    return stored;
  }
  spdlog::debug("system: transferred {} lamports {} -> {}", lamports,
                to_string(from_info.key), to_string(to_info.key));
  return {};
}

}  // namespace raceswap::runtime
