#pragma once
#include <raceswap/schema/account_reference.hpp>
#include <raceswap/schema/config_updated.hpp>
#include <raceswap/schema/encoding/borsh/reader.hpp>
#include <raceswap/schema/encoding/borsh/writer.hpp>
#include <raceswap/schema/execute_raceswap.hpp>
#include <raceswap/schema/execute_swap.hpp>
#include <raceswap/schema/fee_config.hpp>
#include <raceswap/schema/initialize_config.hpp>
#include <raceswap/schema/primitives.hpp>
#include <raceswap/schema/serialized_instruction.hpp>
#include <raceswap/schema/swap_executed.hpp>
#include <raceswap/schema/update_config.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Little-endian binary layout: fixed-width integers, 1-byte booleans, u32
// element-count prefixes for sequences and a 1-byte tag for options.
namespace raceswap::schema::encoding::borsh {

void encode(writer& w, uint8_t value);
void encode(writer& w, uint16_t value);
void encode(writer& w, uint32_t value);
void encode(writer& w, uint64_t value);
void encode(writer& w, bool value);
void encode(writer& w, const raceswap::schema::bytes_t& value);

bool decode(reader& r, uint8_t& value);
bool decode(reader& r, uint16_t& value);
bool decode(reader& r, uint32_t& value);
bool decode(reader& r, uint64_t& value);
bool decode(reader& r, bool& value);
bool decode(reader& r, raceswap::schema::bytes_t& value);

template <std::size_t N>
void encode(writer& w, const std::array<uint8_t, N>& value);
template <typename T>
void encode(writer& w, const std::vector<T>& value);
template <typename T>
void encode(writer& w, const std::optional<T>& value);

template <std::size_t N>
bool decode(reader& r, std::array<uint8_t, N>& value);
template <typename T>
bool decode(reader& r, std::vector<T>& value);
template <typename T>
bool decode(reader& r, std::optional<T>& value);

void encode(writer& w, const raceswap::schema::full_account_reference_t& o);
bool decode(reader& r, raceswap::schema::full_account_reference_t& o);

void encode(writer& w, const raceswap::schema::indexed_account_reference_t& o);
bool decode(reader& r, raceswap::schema::indexed_account_reference_t& o);

void encode(writer& w, const raceswap::schema::serialized_instruction_t& o);
bool decode(reader& r, raceswap::schema::serialized_instruction_t& o);

void encode(writer& w, const raceswap::schema::execute_swap_t& o);
bool decode(reader& r, raceswap::schema::execute_swap_t& o);

void encode(writer& w, const raceswap::schema::execute_swap_indexed_t& o);
bool decode(reader& r, raceswap::schema::execute_swap_indexed_t& o);

void encode(writer& w, const raceswap::schema::execute_raceswap_t& o);
bool decode(reader& r, raceswap::schema::execute_raceswap_t& o);

void encode(writer& w, const raceswap::schema::fee_config_t& o);
bool decode(reader& r, raceswap::schema::fee_config_t& o);

void encode(writer& w, const raceswap::schema::initialize_config_t& o);
bool decode(reader& r, raceswap::schema::initialize_config_t& o);

void encode(writer& w, const raceswap::schema::update_config_t& o);
bool decode(reader& r, raceswap::schema::update_config_t& o);

void encode(writer& w, const raceswap::schema::swap_executed_t& o);
bool decode(reader& r, raceswap::schema::swap_executed_t& o);

void encode(writer& w, const raceswap::schema::config_updated_t& o);
bool decode(reader& r, raceswap::schema::config_updated_t& o);

template <std::size_t N>
void encode(writer& w, const std::array<uint8_t, N>& value) {
  w.write(value);
}

template <typename T>
void encode(writer& w, const std::vector<T>& value) {
  w.write(static_cast<uint32_t>(value.size()));
  for (const auto& element : value) {
    encode(w, static_cast<const T&>(element));
  }
}

template <typename T>
void encode(writer& w, const std::optional<T>& value) {
  w.write(value.has_value() ? uint8_t{1} : uint8_t{0});
  if (value) {
    encode(w, *value);
  }
}

template <std::size_t N>
bool decode(reader& r, std::array<uint8_t, N>& value) {
  return r.read(value);
}

template <typename T>
bool decode(reader& r, std::vector<T>& value) {
  auto count = uint32_t{};
  if (!r.read(count)) {
    return false;
  }
  // Every element occupies at least one byte; a larger count cannot be
  // satisfied and must not drive the allocation.
  if (count > r.remaining()) {
    return false;
  }
  value.clear();
  value.reserve(count);
  for (auto i = uint32_t{0}; i < count; ++i) {
    auto element = T{};
    if (!decode(r, element)) {
      return false;
    }
    value.push_back(std::move(element));
  }
  return true;
}

template <typename T>
bool decode(reader& r, std::optional<T>& value) {
  auto tag = uint8_t{};
  if (!r.read(tag)) {
    return false;
  }
  if (tag == 0) {
    value.reset();
    return true;
  }
  if (tag != 1) {
    return false;
  }
  auto inner = T{};
  if (!decode(r, inner)) {
    return false;
  }
  value = std::move(inner);
  return true;
}

}  // namespace raceswap::schema::encoding::borsh
