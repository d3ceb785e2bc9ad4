#pragma once

#include <raceswap/schema/primitives.hpp>

#include <string_view>
#include <vector>

namespace raceswap::crypto {

raceswap::schema::hash32_t sha256(const raceswap::schema::bytes_view_t& bytes);
raceswap::schema::hash32_t sha256(std::string_view str);

/// Digest of the concatenation of `parts`, without materializing it.
raceswap::schema::hash32_t sha256(
    const std::vector<raceswap::schema::bytes_view_t>& parts);

}  // namespace raceswap::crypto
