#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace raceswap::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using pubkey_t = hash32_t;
using lamports_t = uint64_t;
using basis_points_t = uint16_t;

// One seed list per program-derived signer of a cross-program invocation.
using seeds_t = std::vector<bytes_t>;
using signer_seeds_t = std::vector<seeds_t>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// Bitcoin-alphabet base58, the textual form of ledger addresses.
std::string to_base58(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base58(std::string_view encoded);

std::string to_string(const pubkey_t& key);
pubkey_t make_pubkey(std::string_view base58);
std::optional<pubkey_t> try_make_pubkey(std::string_view base58);
std::optional<pubkey_t> try_make_pubkey(const bytes_view_t& bytes);
pubkey_t make_zero_pubkey();

}  // namespace raceswap::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
