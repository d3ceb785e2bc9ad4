#pragma once

#include <raceswap/runtime/runtime_error_code.hpp>
#include <raceswap/schema/account.hpp>
#include <raceswap/schema/instruction.hpp>
#include <raceswap/schema/primitives.hpp>
#include <raceswap/schema/transaction_result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raceswap::runtime {

/// What a program sees when it is invoked: its own id, the accounts of the
/// instruction with the privileges the runtime actually granted, and the
/// instruction data. Account states are as of invocation; re-read through
/// `host::load` after any nested invocation.
struct invocation_t final {
  raceswap::schema::pubkey_t program_id{};
  std::vector<raceswap::schema::account_info_t> accounts;
  raceswap::schema::bytes_t data;
};

/// Services the ledger offers to an executing program.
class host {
 public:
  virtual ~host() = default;

  /// Current state of `key` as seen by the executing instruction, including
  /// writes staged earlier in the same transaction.
  virtual std::optional<raceswap::schema::account_t> load(
      const raceswap::schema::pubkey_t& key) const = 0;

  /// Stage a new state for `key`. Rejected unless the account was granted
  /// writable to the current instruction and, for data changes, debits and
  /// owner changes, the current program owns it.
  virtual raceswap::schema::transaction_result_t store(
      const raceswap::schema::pubkey_t& key,
      const raceswap::schema::account_t& account) = 0;

  /// Cross-program invocation. Each `signer_seeds` entry lets an address
  /// derived from the current program with those seeds sign.
  virtual raceswap::schema::transaction_result_t invoke(
      const raceswap::schema::instruction_t& instruction,
      const raceswap::schema::signer_seeds_t& signer_seeds) = 0;

  virtual void log(std::string_view message) = 0;
};

class program {
 public:
  virtual ~program() = default;

  virtual raceswap::schema::transaction_result_t process(
      host& host,
      const invocation_t& invocation) = 0;
};

raceswap::schema::transaction_result_t make_runtime_error(
    runtime_error_code code,
    std::string info = {});

}  // namespace raceswap::runtime
