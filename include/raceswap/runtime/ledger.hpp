#pragma once

#include <raceswap/runtime/host.hpp>
#include <raceswap/schema/account.hpp>
#include <raceswap/schema/encoding/encoder.hpp>
#include <raceswap/schema/instruction.hpp>
#include <raceswap/schema/primitives.hpp>
#include <raceswap/schema/transaction_result.hpp>
#include <raceswap/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raceswap::runtime {

inline constexpr auto kMaxInvocationDepth = std::size_t{4};

/// A signed batch of instructions executed atomically.
struct transaction_t final {
  std::vector<raceswap::schema::pubkey_t> signers;
  std::vector<raceswap::schema::instruction_t> instructions;
};

/// Embeddable account ledger hosting programs.
///
/// Every transaction runs against a write overlay: either all instructions
/// succeed and the overlay is committed with one RocksDB write batch, or the
/// overlay is dropped. Cross-program invocations are privilege checked; a
/// callee may receive signer only for accounts the caller holds as signer or
/// derives from its own id with the supplied seeds, and writable only where
/// the caller is writable.
class ledger final : public host {
 public:
  using encoder_t = raceswap::schema::encoding::encoder<
      raceswap::schema::encoding::scale_encoder_tag>;
  using storage_t =
      raceswap::storage::storage<raceswap::storage::rocksdb_storage_tag>;

  /// Registers the builtin system and token programs.
  ledger(encoder_t& encoder, storage_t& storage);

  /// Make `program` executable at `program_id`. Replaces an earlier
  /// registration.
  void register_program(const raceswap::schema::pubkey_t& program_id,
                        std::shared_ptr<program> program);

  /// Genesis write outside any transaction; committed immediately.
  void set_account(const raceswap::schema::pubkey_t& key,
                   const raceswap::schema::account_t& account);

  /// Committed state of `key`.
  std::optional<raceswap::schema::account_t> account(
      const raceswap::schema::pubkey_t& key) const;

  raceswap::schema::transaction_result_t execute(
      const transaction_t& transaction);

  raceswap::schema::hash32_t state_root() const;
  uint64_t transaction_count() const;

  /// Program log lines of the most recent transaction.
  std::vector<std::string> last_logs() const;

  std::optional<raceswap::schema::account_t> load(
      const raceswap::schema::pubkey_t& key) const override;
  raceswap::schema::transaction_result_t store(
      const raceswap::schema::pubkey_t& key,
      const raceswap::schema::account_t& account) override;
  raceswap::schema::transaction_result_t invoke(
      const raceswap::schema::instruction_t& instruction,
      const raceswap::schema::signer_seeds_t& signer_seeds) override;
  void log(std::string_view message) override;

 private:
  struct frame_t final {
    raceswap::schema::pubkey_t program_id{};
    std::vector<raceswap::schema::account_info_t> accounts;
  };

  raceswap::schema::transaction_result_t execute_instruction(
      const raceswap::schema::pubkey_t& program_id,
      std::vector<raceswap::schema::account_info_t> accounts,
      const raceswap::schema::bytes_t& data);

  raceswap::schema::account_t load_or_default(
      const raceswap::schema::pubkey_t& key) const;
  std::optional<raceswap::schema::account_t> load_committed(
      const raceswap::schema::pubkey_t& key) const;
  const raceswap::schema::account_info_t* find_in_frame(
      const raceswap::schema::pubkey_t& key) const;
  void commit_overlay(bool count_transaction);

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  std::map<raceswap::schema::pubkey_t, std::shared_ptr<program>> programs_;
  std::map<raceswap::schema::pubkey_t, raceswap::schema::account_t> overlay_;
  std::vector<frame_t> frames_;
  std::vector<std::string> logs_;
  raceswap::storage::committed_state committed_;
};

}  // namespace raceswap::runtime
