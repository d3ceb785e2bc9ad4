#pragma once
#include <raceswap/schema/primitives.hpp>
#include <optional>
#include <span>

namespace raceswap::schema::encoding {

// The wire library is a build time choice. Instruction and account data use
// the little-endian binary layout the deployed program speaks
// (`borsh_encoder_tag`); ledger-internal records use SCALE
// (`scale_encoder_tag`).
template <typename Library>
struct encoder {
  template <typename T>
  raceswap::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, raceswap::schema::bytes_t& out);

  template <typename T>
  T decode(const raceswap::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const raceswap::schema::bytes_view_t& bytes);
};

}  // namespace raceswap::schema::encoding
