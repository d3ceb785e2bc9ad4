#include <raceswap/execution/permission_reconciler.hpp>

#include <spdlog/spdlog.h>

namespace raceswap::execution {

std::vector<raceswap::schema::account_meta_t> reconcile(
    const std::vector<resolved_account_t>& accounts,
    const std::optional<derived_authority>& authority) {
  auto metas = std::vector<raceswap::schema::account_meta_t>{};
  metas.reserve(accounts.size());
  for (const auto& account : accounts) {
    auto is_signer = account.requested_signer && account.granted_signer;
    if (authority && authority->restricts(account.key)) {
      if (account.requested_signer) {
        spdlog::debug("Stripping signer from authority {}",
                      raceswap::schema::to_string(account.key));
      }
      is_signer = false;
    }
    metas.push_back(raceswap::schema::account_meta_t{
        .pubkey = account.key,
        .is_signer = is_signer,
        .is_writable = account.granted_writable});
  }
  return metas;
}

}  // namespace raceswap::execution
