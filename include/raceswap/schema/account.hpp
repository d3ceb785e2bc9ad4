#pragma once
#include <raceswap/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger account.
// Host workflow: persisted account record plus the per-invocation view that
// carries the privileges the current instruction actually granted.
namespace raceswap::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  pubkey_t owner{};
  lamports_t lamports{};
  bytes_t data;
  bool executable{};

  friend bool operator==(const account<1>&, const account<1>&) = default;
};

using account_t = account<1>;

struct account_info_t final {
  pubkey_t key{};
  bool is_signer{};
  bool is_writable{};
  account_t account;
};

}  // namespace raceswap::schema
