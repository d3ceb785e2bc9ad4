#pragma once
#include <raceswap/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

// Schema type: token account.
// Token workflow: packed token account record; `owner` is the token-level
// authority, distinct from the ledger owner (the token program).
namespace raceswap::schema::token {

inline constexpr auto kTokenAccountSize = std::size_t{165};

enum class account_state_t : uint8_t {
  uninitialized = 0,
  initialized = 1,
  frozen = 2
};

struct token_account_t final {
  pubkey_t mint{};
  pubkey_t owner{};
  uint64_t amount{};
  std::optional<pubkey_t> delegate;
  account_state_t state{account_state_t::initialized};
  std::optional<uint64_t> is_native;
  uint64_t delegated_amount{};
  std::optional<pubkey_t> close_authority;

  friend bool operator==(const token_account_t&,
                         const token_account_t&) = default;
};

/// Decode the base token account record. Fails on short input, on malformed
/// option tags and on an uninitialized account.
std::optional<token_account_t> try_decode_token_account(
    const bytes_view_t& data);

bytes_t encode_token_account(const token_account_t& account);

}  // namespace raceswap::schema::token
