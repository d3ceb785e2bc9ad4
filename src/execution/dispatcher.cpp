#include <raceswap/execution/dispatcher.hpp>
#include <raceswap/execution/permission_reconciler.hpp>
#include <raceswap/schema/instruction.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <utility>

using namespace raceswap::schema;

namespace raceswap::execution {

dispatcher::dispatcher(raceswap::runtime::host& host,
                       const pubkey_t& aggregator_program)
    : host_{host}, aggregator_program_{aggregator_program} {}

status_t dispatcher::dispatch(std::vector<account_meta_t> metas,
                              const bytes_t& data) {
  spdlog::debug("Forwarding {} account(s) and {} byte(s) to {}", metas.size(),
                data.size(), to_string(aggregator_program_));
  auto instruction = instruction_t{.program_id = aggregator_program_,
                                   .accounts = std::move(metas),
                                   .data = data};
  auto result = host_.invoke(instruction, {});
  if (!result.ok()) {
    return fail(swap_error_code::swap_cpi_failed,
                fmt::format("[{}:{}] {} {}", result.codespace, result.code,
                            result.log, result.info));
  }
  return std::nullopt;
}

status_t dispatcher::dispatch_leg(
    const serialized_instruction_t& leg,
    account_cursor& cursor,
    const std::optional<derived_authority>& authority) {
  if (leg.is_writable.size() != leg.accounts_len ||
      leg.is_signer.size() != leg.accounts_len) {
    return fail(swap_error_code::invalid_leg_shape,
                fmt::format("{} account(s), {} writable flag(s), {} signer "
                            "flag(s)",
                            leg.accounts_len, leg.is_writable.size(),
                            leg.is_signer.size()));
  }
  auto slice = cursor.take(leg.accounts_len);
  if (!slice) {
    return fail(swap_error_code::account_mismatch,
                fmt::format("leg needs {} account(s), {} remain",
                            leg.accounts_len, cursor.remaining()));
  }

  auto resolved = std::vector<resolved_account_t>{};
  resolved.reserve(slice->size());
  for (std::size_t i = 0; i < slice->size(); ++i) {
    const auto& info = (*slice)[i];
    resolved.push_back(resolved_account_t{.key = info.key,
                                          .granted_signer = info.is_signer,
                                          .granted_writable = info.is_writable,
                                          .requested_signer = leg.is_signer[i]});
  }
  return dispatch(reconcile(resolved, authority), leg.data);
}

}  // namespace raceswap::execution
