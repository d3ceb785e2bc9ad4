#pragma once
#include <raceswap/schema/primitives.hpp>
#include <blake3.h>
#include <cstdint>
#include <span>
#include <string_view>

namespace raceswap::blake3 {

raceswap::schema::hash32_t hash(const std::string_view& str);
raceswap::schema::hash32_t hash(const raceswap::schema::bytes_view_t& bytes);

/// Incremental hasher for material that is produced piecewise.
class hasher final {
 public:
  hasher();

  hasher& update(const raceswap::schema::bytes_view_t& bytes);
  raceswap::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

}  // namespace raceswap::blake3
