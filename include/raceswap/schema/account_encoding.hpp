#pragma once

#include <raceswap/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// How a single-leg request names the accounts of its forwarded call.
//  full: explicit 34-byte {key, signer, writable} records.
//  indexed: 2-byte {index, wanted writable} records into the outer table.
namespace raceswap::schema {

enum class account_encoding_t : uint8_t { full = 0, indexed = 1 };

inline constexpr auto kAccountEncodingMappings = std::array{
    std::pair<std::string_view, account_encoding_t>{"full",
                                                    account_encoding_t::full},
    std::pair<std::string_view, account_encoding_t>{
        "indexed", account_encoding_t::indexed},
};

template <>
inline std::optional<account_encoding_t> try_from_string<account_encoding_t>(
    const std::string_view value) {
  return from_string(value, kAccountEncodingMappings);
}

inline constexpr std::string_view to_string(const account_encoding_t value) {
  return to_string(value, kAccountEncodingMappings).value_or("unknown");
}

}  // namespace raceswap::schema
