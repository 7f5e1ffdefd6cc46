#include "docsync/core/fingerprint.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

#include "docsync/core/version_metadata.hpp"

namespace docsync::core {

namespace {

constexpr const char* kWhitespace = " \t\n\r\f\v";

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string hexEncode(const unsigned char* data, unsigned int len) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<size_t>(len) * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

}  // namespace

std::string Fingerprint::normalize(std::string_view text) {
  std::string stripped = VersionMetadataCodec::strip(text);

  auto first = stripped.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return {};
  }
  auto last = stripped.find_last_not_of(kWhitespace);
  return stripped.substr(first, last - first + 1);
}

std::string Fingerprint::compute(std::string_view text) {
  const std::string normalized = normalize(text);

  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (EVP_DigestUpdate(ctx.get(), normalized.data(), normalized.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  return hexEncode(out, out_len);
}

bool Fingerprint::equal(std::string_view a, std::string_view b) {
  return compute(a) == compute(b);
}

}  // namespace docsync::core
