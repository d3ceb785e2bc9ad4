#include <raceswap/schema/encoding/borsh/reader.hpp>

#include <boost/endian/conversion.hpp>

#include <iterator>

namespace raceswap::schema::encoding::borsh {

reader::reader(const raceswap::schema::bytes_view_t& bytes) : bytes_{bytes} {}

bool reader::read(uint8_t& value) {
  if (remaining() < 1) {
    return false;
  }
  value = bytes_[offset_++];
  return true;
}

bool reader::read(uint16_t& value) {
  if (remaining() < sizeof(uint16_t)) {
    return false;
  }
  value = boost::endian::load_little_u16(bytes_.data() + offset_);
  offset_ += sizeof(uint16_t);
  return true;
}

bool reader::read(uint32_t& value) {
  if (remaining() < sizeof(uint32_t)) {
    return false;
  }
  value = boost::endian::load_little_u32(bytes_.data() + offset_);
  offset_ += sizeof(uint32_t);
  return true;
}

bool reader::read(uint64_t& value) {
  if (remaining() < sizeof(uint64_t)) {
    return false;
  }
  value = boost::endian::load_little_u64(bytes_.data() + offset_);
  offset_ += sizeof(uint64_t);
  return true;
}

bool reader::read(bool& value) {
  if (remaining() < 1 || bytes_[offset_] > 1) {
    return false;
  }
  value = bytes_[offset_++] == 1;
  return true;
}

bool reader::read_bytes(const std::size_t count,
                        raceswap::schema::bytes_t& out) {
  if (remaining() < count) {
    return false;
  }
  auto first = std::next(std::begin(bytes_), static_cast<std::ptrdiff_t>(offset_));
  out.assign(first, std::next(first, static_cast<std::ptrdiff_t>(count)));
  offset_ += count;
  return true;
}

}  // namespace raceswap::schema::encoding::borsh
