#pragma once
#include <raceswap/common/critical.hpp>
#include <raceswap/schema/encoding/borsh/codec.hpp>
#include <raceswap/schema/encoding/encoder.hpp>
#include <iterator>
#include <utility>

namespace raceswap::schema::encoding {

struct borsh_encoder_tag {};

template <>
struct encoder<borsh_encoder_tag> final {
  template <typename T>
  raceswap::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, raceswap::schema::bytes_t& out);

  template <typename T>
  T decode(const raceswap::schema::bytes_view_t& bytes);

  /// Decoding fails unless the value consumes the input exactly.
  template <typename T>
  std::optional<T> try_decode(const raceswap::schema::bytes_view_t& bytes);
};

template <typename T>
raceswap::schema::bytes_t encoder<borsh_encoder_tag>::encode(const T& obj) {
  auto out = raceswap::schema::bytes_t{};
  encode(obj, out);
  return out;
}

template <typename T>
void encoder<borsh_encoder_tag>::encode(const T& obj,
                                        raceswap::schema::bytes_t& out) {
  auto w = borsh::writer{out};
  borsh::encode(w, obj);
}

template <typename T>
T encoder<borsh_encoder_tag>::decode(
    const raceswap::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    raceswap::common::critical("failed to decode binary record");
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<borsh_encoder_tag>::try_decode(
    const raceswap::schema::bytes_view_t& bytes) {
  auto r = borsh::reader{bytes};
  auto value = T{};
  if (!borsh::decode(r, value) || !r.exhausted()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace raceswap::schema::encoding
