#include <raceswap/schema/encoding/borsh/writer.hpp>

#include <boost/endian/conversion.hpp>

#include <array>

namespace raceswap::schema::encoding::borsh {

void writer::write(const uint8_t value) {
  out_.push_back(value);
}

void writer::write(const uint16_t value) {
  auto buffer = std::array<uint8_t, sizeof(uint16_t)>{};
  boost::endian::store_little_u16(buffer.data(), value);
  write(buffer);
}

void writer::write(const uint32_t value) {
  auto buffer = std::array<uint8_t, sizeof(uint32_t)>{};
  boost::endian::store_little_u32(buffer.data(), value);
  write(buffer);
}

void writer::write(const uint64_t value) {
  auto buffer = std::array<uint8_t, sizeof(uint64_t)>{};
  boost::endian::store_little_u64(buffer.data(), value);
  write(buffer);
}

void writer::write(const bool value) {
  out_.push_back(value ? uint8_t{1} : uint8_t{0});
}

void writer::write_bytes(const raceswap::schema::bytes_view_t& bytes) {
  out_.insert(std::end(out_), std::begin(bytes), std::end(bytes));
}

}  // namespace raceswap::schema::encoding::borsh
