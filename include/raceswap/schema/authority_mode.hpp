#pragma once

#include <raceswap/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Who authorizes the forwarded call.
//  direct: the requester's own signature passes through; no holding vault.
//  derived: input is moved into a vault owned by the program-derived
//  authority, which is never forwarded as a signer.
namespace raceswap::schema {

enum class authority_mode_t : uint8_t { direct = 0, derived = 1 };

inline constexpr auto kAuthorityModeMappings = std::array{
    std::pair<std::string_view, authority_mode_t>{"direct",
                                                  authority_mode_t::direct},
    std::pair<std::string_view, authority_mode_t>{"derived",
                                                  authority_mode_t::derived},
};

template <>
inline std::optional<authority_mode_t> try_from_string<authority_mode_t>(
    const std::string_view value) {
  return from_string(value, kAuthorityModeMappings);
}

inline constexpr std::string_view to_string(const authority_mode_t value) {
  return to_string(value, kAuthorityModeMappings).value_or("unknown");
}

}  // namespace raceswap::schema
