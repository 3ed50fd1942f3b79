#include <keystone/common/critical.hpp>
#include <keystone/crypto/hash.hpp>

#include <openssl/evp.h>

#include <memory>

namespace keystone::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

keystone::schema::hash32_t sha256(
    const keystone::schema::bytes_view_t& bytes) {
  return sha256(std::span<const keystone::schema::bytes_view_t>{&bytes, 1});
}

keystone::schema::hash32_t sha256(
    std::span<const keystone::schema::bytes_view_t> parts) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    keystone::common::critical("failed to allocate SHA-256 context");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    keystone::common::critical("failed to initialize SHA-256");
  }
  for (const auto& part : parts) {
    if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      keystone::common::critical("failed to update SHA-256");
    }
  }

  auto output = keystone::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    keystone::common::critical("failed to finalize SHA-256");
  }
  return output;
}

}  // namespace keystone::crypto
