#include <raceswap/address/program_address.hpp>
#include <raceswap/crypto/curve25519.hpp>
#include <raceswap/crypto/sha256.hpp>

#include <string_view>
#include <vector>

namespace raceswap::address {

namespace {

constexpr auto kProgramDerivedAddressMarker =
    std::string_view{"ProgramDerivedAddress"};

}  // namespace

std::optional<raceswap::schema::pubkey_t> create_program_address(
    const raceswap::schema::seeds_t& seeds,
    const raceswap::schema::pubkey_t& program_id) {
  if (seeds.size() > kMaxSeeds) {
    return std::nullopt;
  }
  auto parts = std::vector<raceswap::schema::bytes_view_t>{};
  parts.reserve(seeds.size() + 2);
  for (const auto& seed : seeds) {
    if (seed.size() > kMaxSeedLength) {
      return std::nullopt;
    }
    parts.emplace_back(seed);
  }
  parts.emplace_back(program_id);
  parts.push_back(
      raceswap::schema::make_bytes_view(kProgramDerivedAddressMarker));

  auto candidate = raceswap::crypto::sha256(parts);
  if (raceswap::crypto::is_on_curve(candidate)) {
    return std::nullopt;
  }
  return candidate;
}

std::optional<program_address_t> find_program_address(
    const raceswap::schema::seeds_t& seeds,
    const raceswap::schema::pubkey_t& program_id) {
  if (seeds.size() >= kMaxSeeds) {
    return std::nullopt;
  }
  auto with_bump = seeds;
  with_bump.push_back(raceswap::schema::bytes_t{0});
  for (auto bump = 255; bump > 0; --bump) {
    with_bump.back()[0] = static_cast<uint8_t>(bump);
    if (auto address = create_program_address(with_bump, program_id)) {
      return program_address_t{.address = *address,
                               .bump = static_cast<uint8_t>(bump)};
    }
  }
  return std::nullopt;
}

}  // namespace raceswap::address
