#include <raceswap/common/critical.hpp>
#include <raceswap/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace raceswap::schema {

namespace {

constexpr auto kBase58Alphabet = std::string_view{
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base58_digit(const char c) {
  auto position = kBase58Alphabet.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    raceswap::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base58(const bytes_view_t& bytes) {
  auto zeros = size_t{0};
  while (zeros < bytes.size() && bytes[zeros] == 0) {
    ++zeros;
  }

  // Little-endian base58 digits of the big-endian input number.
  auto digits = std::vector<uint8_t>{};
  digits.reserve((bytes.size() * 138 / 100) + 1);
  for (auto i = zeros; i < bytes.size(); ++i) {
    auto carry = static_cast<uint32_t>(bytes[i]);
    for (auto& digit : digits) {
      carry += static_cast<uint32_t>(digit) << 8u;
      digit = static_cast<uint8_t>(carry % 58u);
      carry /= 58u;
    }
    while (carry > 0) {
      digits.push_back(static_cast<uint8_t>(carry % 58u));
      carry /= 58u;
    }
  }

  auto out = std::string(zeros, kBase58Alphabet[0]);
  out.reserve(zeros + digits.size());
  for (auto it = std::rbegin(digits); it != std::rend(digits); ++it) {
    out.push_back(kBase58Alphabet[*it]);
  }
  return out;
}

std::optional<bytes_t> try_from_base58(const std::string_view encoded) {
  auto zeros = size_t{0};
  while (zeros < encoded.size() && encoded[zeros] == kBase58Alphabet[0]) {
    ++zeros;
  }

  // Little-endian base256 bytes of the decoded number.
  auto value = std::vector<uint8_t>{};
  value.reserve((encoded.size() * 733 / 1000) + 1);
  for (auto i = zeros; i < encoded.size(); ++i) {
    auto digit = base58_digit(encoded[i]);
    if (!digit) {
      return std::nullopt;
    }
    auto carry = static_cast<uint32_t>(*digit);
    for (auto& byte : value) {
      carry += static_cast<uint32_t>(byte) * 58u;
      byte = static_cast<uint8_t>(carry & 0xFFu);
      carry >>= 8u;
    }
    while (carry > 0) {
      value.push_back(static_cast<uint8_t>(carry & 0xFFu));
      carry >>= 8u;
    }
  }

  auto out = bytes_t(zeros, 0);
  out.reserve(zeros + value.size());
  std::copy(std::rbegin(value), std::rend(value), std::back_inserter(out));
  return out;
}

std::string to_string(const pubkey_t& key) {
  return to_base58(bytes_view_t{key.data(), key.size()});
}

pubkey_t make_pubkey(const std::string_view base58) {
  auto key = try_make_pubkey(base58);
  if (!key.has_value()) {
    raceswap::common::critical("invalid base58 address");
  }
  return *key;
}

std::optional<pubkey_t> try_make_pubkey(const std::string_view base58) {
  auto decoded = try_from_base58(base58);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_pubkey(bytes_view_t{decoded->data(), decoded->size()});
}

std::optional<pubkey_t> try_make_pubkey(const bytes_view_t& bytes) {
  auto key = pubkey_t{};
  if (bytes.size() != key.size()) {
    return std::nullopt;
  }
  std::copy(std::begin(bytes), std::end(bytes), std::begin(key));
  return key;
}

pubkey_t make_zero_pubkey() {
  return {};
}

}  // namespace raceswap::schema
