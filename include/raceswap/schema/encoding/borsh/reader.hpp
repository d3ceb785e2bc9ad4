#pragma once
#include <raceswap/schema/primitives.hpp>
#include <array>
#include <cstddef>
#include <cstdint>

namespace raceswap::schema::encoding::borsh {

/// Bounds-checked little-endian cursor over an immutable buffer. Every read
/// fails (returns false, leaves the cursor unchanged) instead of running past
/// the end.
class reader final {
 public:
  explicit reader(const raceswap::schema::bytes_view_t& bytes);

  bool read(uint8_t& value);
  bool read(uint16_t& value);
  bool read(uint32_t& value);
  bool read(uint64_t& value);
  /// Only 0 and 1 are accepted.
  bool read(bool& value);

  template <std::size_t N>
  bool read(std::array<uint8_t, N>& value) {
    if (remaining() < N) {
      return false;
    }
    for (auto& byte : value) {
      byte = bytes_[offset_++];
    }
    return true;
  }

  bool read_bytes(std::size_t count, raceswap::schema::bytes_t& out);

  std::size_t offset() const { return offset_; }
  std::size_t remaining() const { return bytes_.size() - offset_; }
  bool exhausted() const { return offset_ == bytes_.size(); }

 private:
  raceswap::schema::bytes_view_t bytes_;
  std::size_t offset_{};
};

}  // namespace raceswap::schema::encoding::borsh
