#include <raceswap/execution/balance_verifier.hpp>
#include <raceswap/schema/token/token_account.hpp>

#include <fmt/format.h>

namespace raceswap::execution {

std::optional<uint64_t> read_token_balance(
    const raceswap::runtime::host& host,
    const raceswap::schema::pubkey_t& account) {
  auto loaded = host.load(account);
  if (!loaded) {
    return std::nullopt;
  }
  auto decoded = raceswap::schema::token::try_decode_token_account(
      raceswap::schema::bytes_view_t{loaded->data.data(), loaded->data.size()});
  if (!decoded) {
    return std::nullopt;
  }
  return decoded->amount;
}

status_t verify_delta(const delta_check_t& check) {
  if (check.after < check.before) {
    return fail(check.accounting_error,
                fmt::format("balance fell from {} to {}", check.before,
                            check.after));
  }
  const auto delta = check.after - check.before;
  if (delta < check.minimum || (check.require_positive && delta == 0)) {
    return fail(check.below_minimum_error,
                fmt::format("received {} of minimum {}", delta, check.minimum));
  }
  return std::nullopt;
}

}  // namespace raceswap::execution
