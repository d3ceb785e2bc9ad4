#include <raceswap/common/critical.hpp>
#include <raceswap/crypto/sha256.hpp>

#include <openssl/evp.h>

#include <memory>

namespace raceswap::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

raceswap::schema::hash32_t digest(
    const std::vector<raceswap::schema::bytes_view_t>& parts) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    raceswap::common::critical("failed to allocate digest context");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    raceswap::common::critical("failed to initialize sha256");
  }
  for (const auto& part : parts) {
    if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      raceswap::common::critical("failed to update sha256");
    }
  }
  auto out = raceswap::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1 ||
      length != out.size()) {
    raceswap::common::critical("failed to finalize sha256");
  }
  return out;
}

}  // namespace

raceswap::schema::hash32_t sha256(const raceswap::schema::bytes_view_t& bytes) {
  return digest({bytes});
}

raceswap::schema::hash32_t sha256(const std::string_view str) {
  return digest({raceswap::schema::make_bytes_view(str)});
}

raceswap::schema::hash32_t sha256(
    const std::vector<raceswap::schema::bytes_view_t>& parts) {
  return digest(parts);
}

}  // namespace raceswap::crypto
