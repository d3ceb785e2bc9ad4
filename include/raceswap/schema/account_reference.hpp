#pragma once
#include <raceswap/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>

// Schema type: account reference.
// Forwarding workflow: how a request names an account of the forwarded call.
// The flags carried here are what the caller asks for, never what is granted.
namespace raceswap::schema {

// 34 bytes on the wire.
struct full_account_reference_t final {
  pubkey_t pubkey{};
  bool is_signer{};
  bool is_writable{};
};

// 2 bytes on the wire; `index` points into the outer account table.
struct indexed_account_reference_t final {
  uint8_t index{};
  bool is_writable{};
};

inline constexpr auto kFullAccountReferenceSize = std::size_t{34};

}  // namespace raceswap::schema
