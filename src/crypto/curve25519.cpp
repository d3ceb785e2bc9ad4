#include <raceswap/crypto/curve25519.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/integer.hpp>

#include <iterator>

namespace raceswap::crypto {

namespace {

namespace mp = boost::multiprecision;

const mp::cpp_int& field_prime() {
  static const auto p = mp::cpp_int{(mp::cpp_int{1} << 255) - 19};
  return p;
}

// -121665/121666 mod p
const mp::cpp_int& edwards_d() {
  static const auto d = mp::cpp_int{
      "370957059346694393431380835087545651895421138798432190163887855330859402"
      "83555"};
  return d;
}

}  // namespace

bool is_on_curve(const raceswap::schema::pubkey_t& point) {
  auto encoded = point;
  encoded[31] &= 0x7Fu;

  auto y = mp::cpp_int{};
  mp::import_bits(y, std::begin(encoded), std::end(encoded), 8, false);

  const auto& p = field_prime();
  y %= p;
  const auto y2 = mp::cpp_int{(y * y) % p};
  const auto u = mp::cpp_int{(y2 + p - 1) % p};
  const auto v = mp::cpp_int{(edwards_d() * y2 + 1) % p};

  // x^2 = u / v has a solution iff u * v^(p-2) is zero or a quadratic residue.
  const auto v_inverse = mp::cpp_int{mp::powm(v, mp::cpp_int{p - 2}, p)};
  const auto x2 = mp::cpp_int{(u * v_inverse) % p};
  if (x2 == 0) {
    return true;
  }
  return mp::powm(x2, mp::cpp_int{(p - 1) / 2}, p) == 1;
}

}  // namespace raceswap::crypto
