#include <raceswap/schema/encoding/borsh/reader.hpp>
#include <raceswap/schema/encoding/borsh/writer.hpp>
#include <raceswap/schema/token/token_account.hpp>

namespace raceswap::schema::token {

namespace {

// COption fields keep their full width on the wire whether set or not.
template <typename T>
bool read_coption(encoding::borsh::reader& r, std::optional<T>& out) {
  auto tag = uint32_t{};
  auto value = T{};
  if (!r.read(tag) || !r.read(value)) {
    return false;
  }
  if (tag == 0) {
    out.reset();
    return true;
  }
  if (tag != 1) {
    return false;
  }
  out = value;
  return true;
}

template <typename T>
void write_coption(encoding::borsh::writer& w, const std::optional<T>& value) {
  w.write(value.has_value() ? uint32_t{1} : uint32_t{0});
  w.write(value.value_or(T{}));
}

}  // namespace

std::optional<token_account_t> try_decode_token_account(
    const bytes_view_t& data) {
  if (data.size() < kTokenAccountSize) {
    return std::nullopt;
  }
  auto r = encoding::borsh::reader{data.first(kTokenAccountSize)};
  auto account = token_account_t{};
  auto state = uint8_t{};
  if (!r.read(account.mint) || !r.read(account.owner) ||
      !r.read(account.amount) || !read_coption(r, account.delegate) ||
      !r.read(state) || !read_coption(r, account.is_native) ||
      !r.read(account.delegated_amount) ||
      !read_coption(r, account.close_authority)) {
    return std::nullopt;
  }
  if (state == static_cast<uint8_t>(account_state_t::uninitialized) ||
      state > static_cast<uint8_t>(account_state_t::frozen)) {
    return std::nullopt;
  }
  account.state = static_cast<account_state_t>(state);
  return account;
}

bytes_t encode_token_account(const token_account_t& account) {
  auto out = bytes_t{};
  out.reserve(kTokenAccountSize);
  auto w = encoding::borsh::writer{out};
  w.write(account.mint);
  w.write(account.owner);
  w.write(account.amount);
  write_coption(w, account.delegate);
  w.write(static_cast<uint8_t>(account.state));
  write_coption(w, account.is_native);
  w.write(account.delegated_amount);
  write_coption(w, account.close_authority);
  return out;
}

}  // namespace raceswap::schema::token
