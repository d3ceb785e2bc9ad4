#pragma once

#include <raceswap/execution/account_source.hpp>
#include <raceswap/execution/status.hpp>
#include <raceswap/execution/vault_authority.hpp>
#include <raceswap/runtime/host.hpp>
#include <raceswap/schema/account_meta.hpp>
#include <raceswap/schema/primitives.hpp>
#include <raceswap/schema/serialized_instruction.hpp>

#include <optional>
#include <vector>

namespace raceswap::execution {

/// Forwards opaque calls to the aggregator program. Calls carry no signer
/// seeds, so the program's own derived addresses never sign them.
class dispatcher final {
 public:
  dispatcher(raceswap::runtime::host& host,
             const raceswap::schema::pubkey_t& aggregator_program);

  /// Invoke the aggregator with already reconciled metas.
  status_t dispatch(std::vector<raceswap::schema::account_meta_t> metas,
                    const raceswap::schema::bytes_t& data);

  /// Take the leg's accounts from `cursor`, reconcile them against the outer
  /// grant and invoke.
  status_t dispatch_leg(const raceswap::schema::serialized_instruction_t& leg,
                        account_cursor& cursor,
                        const std::optional<derived_authority>& authority);

 private:
  raceswap::runtime::host& host_;
  raceswap::schema::pubkey_t aggregator_program_{};
};

}  // namespace raceswap::execution
