#pragma once
#include <raceswap/common/critical.hpp>
#include <raceswap/schema/encoding/encoder.hpp>
#include <raceswap/schema/encoding/scale/account.hpp>
#include <iterator>
#include <scale/scale.hpp>
#include <utility>

namespace raceswap::schema::encoding {

struct scale_encoder_tag {};

/// Ledger-internal records: accounts and the committed-state tuple.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  raceswap::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, raceswap::schema::bytes_t& out);

  /// Stored records are written by this process; a failure means the
  /// database is corrupt.
  template <typename T>
  T decode(const raceswap::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const raceswap::schema::bytes_view_t& bytes);
};

template <typename T>
raceswap::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto out = raceswap::schema::bytes_t{};
  encode(obj, out);
  return out;
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        raceswap::schema::bytes_t& out) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    raceswap::common::critical("SCALE encode failed: {}",
                               encoded.error().message());
  }
  out.insert(std::end(out), std::begin(encoded.value()),
             std::end(encoded.value()));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const raceswap::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    raceswap::common::critical("stored record of {} bytes is not valid SCALE",
                               bytes.size());
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const raceswap::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    spdlog::debug("SCALE decode of {} bytes failed: {}", bytes.size(),
                  decoded.error().message());
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace raceswap::schema::encoding
