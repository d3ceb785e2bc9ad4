#pragma once

#include <raceswap/address/program_address.hpp>
#include <raceswap/runtime/host.hpp>
#include <raceswap/runtime/token_program.hpp>
#include <raceswap/schema/account_meta.hpp>
#include <raceswap/schema/encoding/borsh/reader.hpp>
#include <raceswap/schema/encoding/borsh/writer.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace raceswap::testing {

inline constexpr auto kPoolAuthoritySeed = std::string_view{"pool-authority"};

/// Stand-in for the liquidity aggregator. The first data byte picks the
/// behavior; every call records the metas it was handed.
///
///  credit(amount): [pool, destination, pool_authority] pool pays
///  destination, signed with the pool authority seeds.
///  debit(amount): [pool, source, owner] owner pays the pool.
///  noop: accepts any accounts.
///  fail: returns an error.
///  steal(amount): [source, destination, authority] moves tokens naming
///  `authority` as signer without holding its signature.
class test_aggregator final : public raceswap::runtime::program {
 public:
  enum class op_t : uint8_t { credit = 0, debit = 1, noop = 2, fail = 3,
                              steal = 4 };

  static raceswap::schema::bytes_t make_data(const op_t op,
                                             const uint64_t amount = 0) {
    auto data = raceswap::schema::bytes_t{};
    auto w = raceswap::schema::encoding::borsh::writer{data};
    w.write(static_cast<uint8_t>(op));
    w.write(amount);
    return data;
  }

  static raceswap::address::program_address_t pool_authority(
      const raceswap::schema::pubkey_t& aggregator_id) {
    auto found = raceswap::address::find_program_address(
        raceswap::schema::seeds_t{
            raceswap::schema::make_bytes(kPoolAuthoritySeed)},
        aggregator_id);
    return *found;
  }

  raceswap::schema::transaction_result_t process(
      raceswap::runtime::host& host,
      const raceswap::runtime::invocation_t& invocation) override {
    auto metas = std::vector<raceswap::schema::account_meta_t>{};
    for (const auto& info : invocation.accounts) {
      metas.push_back(raceswap::schema::account_meta_t{
          .pubkey = info.key,
          .is_signer = info.is_signer,
          .is_writable = info.is_writable});
    }
    calls.push_back(metas);

    auto r = raceswap::schema::encoding::borsh::reader{invocation.data};
    auto op = uint8_t{};
    auto amount = uint64_t{};
    if (!r.read(op) || !r.read(amount)) {
      return raceswap::runtime::make_runtime_error(
          raceswap::runtime::runtime_error_code::invalid_instruction_data);
    }
    const auto& accounts = invocation.accounts;
    switch (static_cast<op_t>(op)) {
      case op_t::credit: {
        auto authority = pool_authority(invocation.program_id);
        auto transfer = raceswap::runtime::make_token_transfer_instruction(
            raceswap::runtime::token_program_id(), accounts.at(0).key,
            accounts.at(1).key, accounts.at(2).key, amount);
        return host.invoke(
            transfer,
            raceswap::schema::signer_seeds_t{raceswap::schema::seeds_t{
                raceswap::schema::make_bytes(kPoolAuthoritySeed),
                raceswap::schema::bytes_t{authority.bump}}});
      }
      case op_t::debit: {
        auto transfer = raceswap::runtime::make_token_transfer_instruction(
            raceswap::runtime::token_program_id(), accounts.at(1).key,
            accounts.at(0).key, accounts.at(2).key, amount);
        return host.invoke(transfer, {});
      }
      case op_t::noop:
        return {};
      case op_t::fail:
        return raceswap::runtime::make_runtime_error(
            raceswap::runtime::runtime_error_code::invalid_instruction_data,
            "aggregator route failed");
      case op_t::steal: {
        auto transfer = raceswap::runtime::make_token_transfer_instruction(
            raceswap::runtime::token_program_id(), accounts.at(0).key,
            accounts.at(1).key, accounts.at(2).key, amount);
        return host.invoke(transfer, {});
      }
    }
    return raceswap::runtime::make_runtime_error(
        raceswap::runtime::runtime_error_code::invalid_instruction_data);
  }

  std::vector<std::vector<raceswap::schema::account_meta_t>> calls;
};

}  // namespace raceswap::testing
