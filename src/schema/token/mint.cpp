#include <raceswap/schema/encoding/borsh/reader.hpp>
#include <raceswap/schema/encoding/borsh/writer.hpp>
#include <raceswap/schema/token/mint.hpp>

namespace raceswap::schema::token {

namespace {

bool read_coption(encoding::borsh::reader& r, std::optional<pubkey_t>& out) {
  auto tag = uint32_t{};
  auto key = pubkey_t{};
  if (!r.read(tag) || !r.read(key)) {
    return false;
  }
  if (tag == 0) {
    out.reset();
    return true;
  }
  if (tag != 1) {
    return false;
  }
  out = key;
  return true;
}

void write_coption(encoding::borsh::writer& w,
                   const std::optional<pubkey_t>& value) {
  w.write(value.has_value() ? uint32_t{1} : uint32_t{0});
  w.write(value.value_or(pubkey_t{}));
}

}  // namespace

std::optional<mint_t> try_decode_mint(const bytes_view_t& data) {
  if (data.size() < kMintSize) {
    return std::nullopt;
  }
  auto r = encoding::borsh::reader{data.first(kMintSize)};
  auto mint = mint_t{};
  if (!read_coption(r, mint.mint_authority) || !r.read(mint.supply) ||
      !r.read(mint.decimals) || !r.read(mint.is_initialized) ||
      !read_coption(r, mint.freeze_authority)) {
    return std::nullopt;
  }
  if (!mint.is_initialized) {
    return std::nullopt;
  }
  return mint;
}

bytes_t encode_mint(const mint_t& mint) {
  auto out = bytes_t{};
  out.reserve(kMintSize);
  auto w = encoding::borsh::writer{out};
  write_coption(w, mint.mint_authority);
  w.write(mint.supply);
  w.write(mint.decimals);
  w.write(mint.is_initialized);
  write_coption(w, mint.freeze_authority);
  return out;
}

}  // namespace raceswap::schema::token
