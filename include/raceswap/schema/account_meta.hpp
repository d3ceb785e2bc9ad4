#pragma once
#include <raceswap/schema/primitives.hpp>

// Schema type: account meta.
// Forwarding workflow: one account of an instruction together with the
// privileges the instruction asks the runtime to confer.
namespace raceswap::schema {

struct account_meta_t final {
  pubkey_t pubkey{};
  bool is_signer{};
  bool is_writable{};

  friend bool operator==(const account_meta_t&,
                         const account_meta_t&) = default;
};

}  // namespace raceswap::schema
