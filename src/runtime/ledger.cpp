#include <raceswap/address/program_address.hpp>
#include <raceswap/blake3/hash.hpp>
#include <raceswap/common/critical.hpp>
#include <raceswap/runtime/ledger.hpp>
#include <raceswap/runtime/system_program.hpp>
#include <raceswap/runtime/token_program.hpp>
#include <raceswap/schema/encoding/scale/encoder.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <tuple>
#include <utility>

using namespace raceswap::schema;

namespace {

constexpr auto kAccountPrefix = std::string_view{"ACCT|"};

bytes_t make_account_key(const pubkey_t& key) {
  auto out = make_bytes(kAccountPrefix);
  out.insert(std::end(out), std::begin(key), std::end(key));
  return out;
}

const pubkey_t& native_loader_id() {
  static const auto id =
      make_pubkey("NativeLoader1111111111111111111111111111111");
  return id;
}

// An account listed more than once in one instruction gets the union of the
// privileges requested for it.
std::map<pubkey_t, account_meta_t> merge_privileges(
    const std::vector<account_meta_t>& metas) {
  auto merged = std::map<pubkey_t, account_meta_t>{};
  for (const auto& meta : metas) {
    auto& entry = merged[meta.pubkey];
    entry.pubkey = meta.pubkey;
    entry.is_signer = entry.is_signer || meta.is_signer;
    entry.is_writable = entry.is_writable || meta.is_writable;
  }
  return merged;
}

}  // namespace

namespace raceswap::runtime {

using raceswap::schema::to_string;

ledger::ledger(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {
  auto committed = storage_.load_committed_state();
  if (committed) {
    committed_ = *committed;
  } else {
    committed_.state_root = raceswap::blake3::hasher{}.finalize();
  }
  register_program(system_program_id(), std::make_shared<system_program>());
  auto token = std::make_shared<token_program>();
  register_program(token_program_id(), token);
  register_program(token_2022_program_id(), token);
  spdlog::info("Ledger ready after {} transaction(s)",
               committed_.transaction_count);
}

void ledger::register_program(const pubkey_t& program_id,
                              std::shared_ptr<program> program) {
  auto lock = std::scoped_lock{mutex_};
  programs_[program_id] = std::move(program);
  if (!load_committed(program_id)) {
    overlay_[program_id] = account_t{
        .owner = native_loader_id(), .lamports = 1, .executable = true};
    commit_overlay(false);
  }
  spdlog::debug("Registered program {}", to_string(program_id));
}

void ledger::set_account(const pubkey_t& key, const account_t& account) {
  auto lock = std::scoped_lock{mutex_};
  overlay_.clear();
  overlay_[key] = account;
  commit_overlay(false);
}

std::optional<account_t> ledger::account(const pubkey_t& key) const {
  auto lock = std::scoped_lock{mutex_};
  return load_committed(key);
}

transaction_result_t ledger::execute(const transaction_t& transaction) {
  auto lock = std::scoped_lock{mutex_};
  overlay_.clear();
  frames_.clear();
  logs_.clear();

  auto result = transaction_result_t{};
  for (std::size_t i = 0; i < transaction.instructions.size(); ++i) {
    const auto& instruction = transaction.instructions[i];
    auto privileges = merge_privileges(instruction.accounts);

    auto accounts = std::vector<account_info_t>{};
    accounts.reserve(instruction.accounts.size());
    for (const auto& meta : instruction.accounts) {
      const auto& granted = privileges[meta.pubkey];
      if (granted.is_signer &&
          std::ranges::find(transaction.signers, meta.pubkey) ==
              std::end(transaction.signers)) {
        overlay_.clear();
        spdlog::warn("Rejecting transaction: {} did not sign",
                     to_string(meta.pubkey));
        return make_runtime_error(runtime_error_code::missing_signature,
                                  to_string(meta.pubkey));
      }
      accounts.push_back(account_info_t{.key = meta.pubkey,
                                        .is_signer = granted.is_signer,
                                        .is_writable = granted.is_writable,
                                        .account = load_or_default(meta.pubkey)});
    }

    auto instruction_result = execute_instruction(
        instruction.program_id, std::move(accounts), instruction.data);
    if (!instruction_result.ok()) {
      overlay_.clear();
      frames_.clear();
      spdlog::warn("Transaction failed in instruction {}: [{}:{}] {} {}", i,
                   instruction_result.codespace, instruction_result.code,
                   instruction_result.log, instruction_result.info);
      return instruction_result;
    }
    result.data = std::move(instruction_result.data);
    result.log = std::move(instruction_result.log);
    result.info = std::move(instruction_result.info);
    result.codespace = std::move(instruction_result.codespace);
    std::move(std::begin(instruction_result.events),
              std::end(instruction_result.events),
              std::back_inserter(result.events));
  }

  commit_overlay(true);
  spdlog::info("Committed transaction {} ({} instruction(s))",
               committed_.transaction_count, transaction.instructions.size());
  return result;
}

hash32_t ledger::state_root() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.state_root;
}

uint64_t ledger::transaction_count() const {
  auto lock = std::scoped_lock{mutex_};
  return committed_.transaction_count;
}

std::vector<std::string> ledger::last_logs() const {
  auto lock = std::scoped_lock{mutex_};
  return logs_;
}

std::optional<account_t> ledger::load(const pubkey_t& key) const {
  if (auto staged = overlay_.find(key); staged != std::end(overlay_)) {
    return staged->second;
  }
  return load_committed(key);
}

transaction_result_t ledger::store(const pubkey_t& key,
                                   const account_t& account) {
  if (frames_.empty()) {
    raceswap::common::critical("account store outside of an instruction");
  }
  const auto& frame = frames_.back();
  const auto* info = find_in_frame(key);
  if (info == nullptr) {
    return make_runtime_error(runtime_error_code::account_not_provided,
                              to_string(key));
  }
  if (!info->is_writable) {
    return make_runtime_error(runtime_error_code::readonly_account_modified,
                              to_string(key));
  }

  auto current = load_or_default(key);
  if (account.executable != current.executable) {
    return make_runtime_error(runtime_error_code::external_account_modified,
                              to_string(key));
  }
  if (current.owner != frame.program_id &&
      (account.data != current.data || account.lamports < current.lamports ||
       account.owner != current.owner)) {
    return make_runtime_error(
        runtime_error_code::external_account_modified,
        fmt::format("{} is owned by {}", to_string(key),
                    to_string(current.owner)));
  }
  overlay_[key] = account;
  return {};
}

transaction_result_t ledger::invoke(const instruction_t& instruction,
                                    const signer_seeds_t& signer_seeds) {
  if (frames_.empty()) {
    raceswap::common::critical("invoke outside of an instruction");
  }
  const auto caller = frames_.back().program_id;

  auto derived_signers = std::set<pubkey_t>{};
  for (const auto& seeds : signer_seeds) {
    auto address = raceswap::address::create_program_address(seeds, caller);
    if (!address) {
      return make_runtime_error(runtime_error_code::privilege_escalation,
                                "signer seeds do not derive a program "
                                "address");
    }
    derived_signers.insert(*address);
  }

  auto privileges = merge_privileges(instruction.accounts);
  auto accounts = std::vector<account_info_t>{};
  accounts.reserve(instruction.accounts.size());
  for (const auto& meta : instruction.accounts) {
    const auto& granted = privileges[meta.pubkey];
    const auto* caller_info = find_in_frame(meta.pubkey);
    if (caller_info == nullptr) {
      return make_runtime_error(runtime_error_code::account_not_provided,
                                to_string(meta.pubkey));
    }
    if (granted.is_writable && !caller_info->is_writable) {
      return make_runtime_error(
          runtime_error_code::privilege_escalation,
          fmt::format("{} writable", to_string(meta.pubkey)));
    }
    if (granted.is_signer && !caller_info->is_signer &&
        !derived_signers.contains(meta.pubkey)) {
      return make_runtime_error(
          runtime_error_code::privilege_escalation,
          fmt::format("{} signer", to_string(meta.pubkey)));
    }
    accounts.push_back(account_info_t{.key = meta.pubkey,
                                      .is_signer = granted.is_signer,
                                      .is_writable = granted.is_writable,
                                      .account = load_or_default(meta.pubkey)});
  }

  spdlog::debug("invoke {} from {} at depth {}",
                to_string(instruction.program_id), to_string(caller),
                frames_.size() + 1);
  return execute_instruction(instruction.program_id, std::move(accounts),
                             instruction.data);
}

void ledger::log(const std::string_view message) {
  spdlog::debug("program log: {}", message);
  logs_.emplace_back(message);
}

transaction_result_t ledger::execute_instruction(
    const pubkey_t& program_id,
    std::vector<account_info_t> accounts,
    const bytes_t& data) {
  if (frames_.size() >= kMaxInvocationDepth) {
    return make_runtime_error(runtime_error_code::call_depth_exceeded);
  }
  auto found = programs_.find(program_id);
  if (found == std::end(programs_)) {
    return make_runtime_error(runtime_error_code::program_missing,
                              to_string(program_id));
  }

  auto keys = std::set<pubkey_t>{};
  for (const auto& info : accounts) {
    keys.insert(info.key);
  }
  auto total_lamports = [&]() {
    auto total = boost::multiprecision::uint128_t{};
    for (const auto& key : keys) {
      total += load_or_default(key).lamports;
    }
    return total;
  };
  const auto lamports_before = total_lamports();

  frames_.push_back(frame_t{.program_id = program_id, .accounts = accounts});
  auto invocation = invocation_t{
      .program_id = program_id, .accounts = std::move(accounts), .data = data};
  auto result = found->second->process(*this, invocation);
  frames_.pop_back();

  if (!result.ok()) {
    return result;
  }
  if (total_lamports() != lamports_before) {
    return make_runtime_error(runtime_error_code::unbalanced_instruction,
                              to_string(program_id));
  }
  return result;
}

account_t ledger::load_or_default(const pubkey_t& key) const {
  return load(key).value_or(account_t{.owner = system_program_id()});
}

std::optional<account_t> ledger::load_committed(const pubkey_t& key) const {
  auto storage_key = make_account_key(key);
  return storage_.get<encoder_t, account_t>(
      encoder_, bytes_view_t{storage_key.data(), storage_key.size()});
}

const account_info_t* ledger::find_in_frame(const pubkey_t& key) const {
  if (frames_.empty()) {
    return nullptr;
  }
  const auto& accounts = frames_.back().accounts;
  auto found = std::ranges::find_if(
      accounts, [&](const account_info_t& info) { return info.key == key; });
  return found == std::end(accounts) ? nullptr : &*found;
}

void ledger::commit_overlay(const bool count_transaction) {
  auto entries = std::vector<raceswap::storage::key_value_entry_t>{};
  entries.reserve(overlay_.size());
  for (const auto& [key, account] : overlay_) {
    entries.emplace_back(make_account_key(key), encoder_.encode(account));
  }

  // Root over every account record in key order, as the batch will leave
  // them.
  auto prefix = make_bytes(kAccountPrefix);
  auto merged = std::map<bytes_t, bytes_t>{};
  for (auto& [key, value] : storage_.list_by_prefix(
           bytes_view_t{prefix.data(), prefix.size()})) {
    merged[std::move(key)] = std::move(value);
  }
  for (const auto& [key, value] : entries) {
    merged[key] = value;
  }
  auto hasher = raceswap::blake3::hasher{};
  for (const auto& [key, value] : merged) {
    auto encoded = encoder_.encode(std::tuple{key, value});
    hasher.update(bytes_view_t{encoded.data(), encoded.size()});
  }

  committed_.state_root = hasher.finalize();
  if (count_transaction) {
    ++committed_.transaction_count;
  }
  storage_.commit(entries, committed_);
  overlay_.clear();
}

}  // namespace raceswap::runtime
