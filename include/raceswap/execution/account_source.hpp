#pragma once

#include <raceswap/execution/permission_reconciler.hpp>
#include <raceswap/execution/status.hpp>
#include <raceswap/schema/account.hpp>
#include <raceswap/schema/account_reference.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace raceswap::execution {

/// Positional cursor over the outer accounts that follow the named ones.
/// Legs take consecutive slices; whatever is left at the end is a mismatch.
class account_cursor final {
 public:
  explicit account_cursor(
      std::span<const raceswap::schema::account_info_t> accounts);

  /// The next `count` accounts, or empty when fewer remain. A failed take
  /// does not advance.
  std::optional<std::span<const raceswap::schema::account_info_t>> take(
      std::size_t count);

  std::size_t remaining() const { return accounts_.size() - position_; }
  bool exhausted() const { return remaining() == 0; }

 private:
  std::span<const raceswap::schema::account_info_t> accounts_;
  std::size_t position_{};
};

/// Decode-stage check: every index must address the outer table.
status_t validate_indices(
    const std::vector<raceswap::schema::indexed_account_reference_t>&
        references,
    std::size_t account_count);

/// Resolve explicit references by key against the outer table. Fails when a
/// key was not provided or when an outer account is left unreferenced.
status_t resolve_accounts(
    const std::vector<raceswap::schema::full_account_reference_t>& references,
    std::span<const raceswap::schema::account_info_t> accounts,
    std::vector<resolved_account_t>& out);

/// Resolve index references. An indexed reference asks for no signature of
/// its own, so whatever the outer invocation granted passes through.
status_t resolve_accounts(
    const std::vector<raceswap::schema::indexed_account_reference_t>&
        references,
    std::span<const raceswap::schema::account_info_t> accounts,
    std::vector<resolved_account_t>& out);

}  // namespace raceswap::execution
