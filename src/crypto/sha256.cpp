#include "arcio/crypto/sha256.h"

#include <memory>
#include <string>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "arcio/error.h"

namespace arcio::crypto {
namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

struct MDContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MDCtxPtr = std::unique_ptr<EVP_MD_CTX, MDContextDeleter>;

[[noreturn]] void ThrowDigestError(const char* context) {
  throw Error{ErrorDomain::Internal, errors::Make(ErrorDomain::Internal, 0x01),
              BuildOpenSSLErrorMessage(context)};
}

}  // namespace

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  MDCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowDigestError("EVP_MD_CTX_new");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    ThrowDigestError("EVP_DigestInit_ex");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    ThrowDigestError("EVP_DigestUpdate");
  }
  std::array<uint8_t, 32> digest{};
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 || length != digest.size()) {
    ThrowDigestError("EVP_DigestFinal_ex");
  }
  return digest;
}

std::array<uint8_t, 32> SHA256_Hash(std::string_view text) {
  const auto* data = reinterpret_cast<const uint8_t*>(text.data());
  return SHA256_Hash(std::span<const uint8_t>(data, text.size()));
}

}  // namespace arcio::crypto
