#pragma once

#include <raceswap/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Observability workflow: `swap_executed` and `config_updated` records
// attached to a successful result.
namespace raceswap::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;

  std::optional<std::string> attribute(const std::string_view key) const {
    for (const auto& entry : attributes) {
      if (entry.key == key) {
        return entry.value;
      }
    }
    return std::nullopt;
  }
};

using transaction_event_t = transaction_event<1>;

}  // namespace raceswap::schema
