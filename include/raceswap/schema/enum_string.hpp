#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace raceswap::schema {

/// Display names of an enum, in declaration order.
template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// "full|indexed" style listing for usage and error text.
template <typename Enum, std::size_t N>
std::string join_names(const enum_mappings_t<Enum, N>& mappings,
                       const std::string_view separator = "|") {
  auto joined = std::string{};
  for (const auto& mapping : mappings) {
    if (!joined.empty()) {
      joined.append(separator);
    }
    joined.append(mapping.first);
  }
  return joined;
}

/// Parses a name into `Enum`. Each parseable enum specializes this next to
/// its mapping table.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace raceswap::schema
