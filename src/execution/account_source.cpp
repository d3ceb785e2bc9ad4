#include <raceswap/execution/account_source.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

using namespace raceswap::schema;

namespace raceswap::execution {

namespace {

status_t require_all_referenced(const std::vector<bool>& referenced) {
  auto unused = std::ranges::find(referenced, false);
  if (unused != std::end(referenced)) {
    return fail(swap_error_code::account_mismatch,
                fmt::format("outer account {} is not referenced",
                            std::distance(std::begin(referenced), unused)));
  }
  return std::nullopt;
}

}  // namespace

account_cursor::account_cursor(std::span<const account_info_t> accounts)
    : accounts_{accounts} {}

std::optional<std::span<const account_info_t>> account_cursor::take(
    const std::size_t count) {
  if (count > remaining()) {
    return std::nullopt;
  }
  auto slice = accounts_.subspan(position_, count);
  position_ += count;
  return slice;
}

status_t validate_indices(
    const std::vector<indexed_account_reference_t>& references,
    const std::size_t account_count) {
  for (const auto& reference : references) {
    if (reference.index >= account_count) {
      return fail(swap_error_code::invalid_account_index,
                  fmt::format("index {} with {} account(s)", reference.index,
                              account_count));
    }
  }
  return std::nullopt;
}

status_t resolve_accounts(
    const std::vector<full_account_reference_t>& references,
    std::span<const account_info_t> accounts,
    std::vector<resolved_account_t>& out) {
  auto referenced = std::vector<bool>(accounts.size(), false);
  out.clear();
  out.reserve(references.size());
  for (const auto& reference : references) {
    auto found = std::ranges::find_if(accounts, [&](const account_info_t& info) {
      return info.key == reference.pubkey;
    });
    if (found == std::end(accounts)) {
      return fail(swap_error_code::account_mismatch,
                  fmt::format("{} was not provided", to_string(reference.pubkey)));
    }
    for (std::size_t i = 0; i < accounts.size(); ++i) {
      if (accounts[i].key == reference.pubkey) {
        referenced[i] = true;
      }
    }
    out.push_back(resolved_account_t{.key = found->key,
                                     .granted_signer = found->is_signer,
                                     .granted_writable = found->is_writable,
                                     .requested_signer = reference.is_signer});
  }
  return require_all_referenced(referenced);
}

status_t resolve_accounts(
    const std::vector<indexed_account_reference_t>& references,
    std::span<const account_info_t> accounts,
    std::vector<resolved_account_t>& out) {
  if (auto failure = validate_indices(references, accounts.size()); failure) {
    return failure;
  }
  auto referenced = std::vector<bool>(accounts.size(), false);
  out.clear();
  out.reserve(references.size());
  for (const auto& reference : references) {
    const auto& info = accounts[reference.index];
    referenced[reference.index] = true;
    out.push_back(resolved_account_t{.key = info.key,
                                     .granted_signer = info.is_signer,
                                     .granted_writable = info.is_writable,
                                     .requested_signer = true});
  }
  return require_all_referenced(referenced);
}

}  // namespace raceswap::execution
