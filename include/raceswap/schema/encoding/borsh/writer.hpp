#pragma once
#include <raceswap/schema/primitives.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>

namespace raceswap::schema::encoding::borsh {

/// Appends little-endian fields to a caller-owned buffer.
class writer final {
 public:
  explicit writer(raceswap::schema::bytes_t& out) : out_{out} {}

  void write(uint8_t value);
  void write(uint16_t value);
  void write(uint32_t value);
  void write(uint64_t value);
  void write(bool value);

  template <std::size_t N>
  void write(const std::array<uint8_t, N>& value) {
    out_.insert(std::end(out_), std::begin(value), std::end(value));
  }

  void write_bytes(const raceswap::schema::bytes_view_t& bytes);

 private:
  raceswap::schema::bytes_t& out_;
};

}  // namespace raceswap::schema::encoding::borsh
