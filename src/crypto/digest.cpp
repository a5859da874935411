#include <chronicle/common/critical.hpp>
#include <chronicle/crypto/digest.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <array>
#include <memory>

namespace chronicle::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

std::string sha256_hex(std::initializer_list<std::string_view> parts) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    chronicle::common::critical("crypto", "failed to allocate digest context");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    chronicle::common::critical("crypto", "failed to initialize SHA-256");
  }
  for (const auto& part : parts) {
    if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      chronicle::common::critical("crypto", "failed to update SHA-256");
    }
  }
  auto digest = std::array<uint8_t, EVP_MAX_MD_SIZE>{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    chronicle::common::critical("crypto", "failed to finalize SHA-256");
  }
  return chronicle::schema::to_hex(
      chronicle::schema::bytes_view_t{digest.data(), length});
}

bool secure_equals(const std::string_view lhs, const std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace chronicle::crypto
