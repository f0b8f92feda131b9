#include <gitchurn/crypto.hpp>

#include <openssl/evp.h>

#include <stdexcept>

namespace gitchurn {

static std::string digest_hex(const EVP_MD *md, std::string_view data) {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx)
    throw std::runtime_error("EVP_MD_CTX_new failed");

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (1 != EVP_DigestInit_ex(ctx, md, nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (1 != EVP_DigestUpdate(ctx, data.data(), data.size())) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  if (1 != EVP_DigestFinal_ex(ctx, out, &len)) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  EVP_MD_CTX_free(ctx);
  return to_hex(out, len);
}

std::string sha256_hex(std::string_view data) {
  return digest_hex(EVP_sha256(), data);
}

std::string sha512_hex(std::string_view data) {
  return digest_hex(EVP_sha512(), data);
}

std::string to_hex(const unsigned char *data, std::size_t len) {
  static const char *hex = "0123456789abcdef";
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[2 * i] = hex[(data[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[data[i] & 0xF];
  }
  return out;
}

} // namespace gitchurn
