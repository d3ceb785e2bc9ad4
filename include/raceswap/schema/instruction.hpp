#pragma once
#include <raceswap/schema/account_meta.hpp>
#include <raceswap/schema/primitives.hpp>
#include <vector>

namespace raceswap::schema {

struct instruction_t final {
  pubkey_t program_id{};
  std::vector<account_meta_t> accounts;
  bytes_t data;
};

}  // namespace raceswap::schema
