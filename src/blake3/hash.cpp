#include <raceswap/blake3/hash.hpp>

namespace raceswap::blake3 {

raceswap::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(raceswap::schema::make_bytes_view(str)).finalize();
}

raceswap::schema::hash32_t hash(const raceswap::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const raceswap::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

raceswap::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN
  auto output = raceswap::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

}  // namespace raceswap::blake3
