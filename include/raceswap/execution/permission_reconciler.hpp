#pragma once

#include <raceswap/execution/vault_authority.hpp>
#include <raceswap/schema/account_meta.hpp>
#include <raceswap/schema/primitives.hpp>

#include <optional>
#include <vector>

namespace raceswap::execution {

/// One forwarded account: what the outer invocation granted and whether the
/// request asked for a signature.
struct resolved_account_t final {
  raceswap::schema::pubkey_t key{};
  bool granted_signer{};
  bool granted_writable{};
  bool requested_signer{};
};

/// Build forwarded metas that never exceed the outer grant.
///
/// is_writable is the granted bit; the requested writable flag carries no
/// weight. is_signer requires both request and grant, and is always false
/// for the key `authority` restricts.
std::vector<raceswap::schema::account_meta_t> reconcile(
    const std::vector<resolved_account_t>& accounts,
    const std::optional<derived_authority>& authority = std::nullopt);

}  // namespace raceswap::execution
