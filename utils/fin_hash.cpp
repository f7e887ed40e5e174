#include "fin_hash.h"
#include <openssl/evp.h>
#include <fstream>
#include <memory>

namespace {

  struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
  };

  fin_string to_hex(const unsigned char* digest, unsigned int len) {
    static const char* digits = "0123456789abcdef";
    fin_string hex;
    hex.to_std().reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
      hex += digits[digest[i] >> 4];
      hex += digits[digest[i] & 0x0f];
    }
    return hex;
  }

}

fin_string sha256_hex(const fin_string& data)
{
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 digest failed");
  }
  return to_hex(digest, len);
}

bool sha256_file(const fin_string& path, fin_string& hex_out)
{
  std::ifstream file(path.c_str(), std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return false;
  }

  std::unique_ptr<EVP_MD_CTX, md_ctx_deleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return false;
  }

  std::vector<char> buffer(1 << 16);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize got = file.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
      return false;
    }
  }
  if (file.bad()) {
    return false;
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
    return false;
  }
  hex_out = to_hex(digest, len);
  return true;
}

fin_string base64_encode(const std::vector<unsigned char>& bytes)
{
  if (bytes.empty()) {
    return fin_string();
  }
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), bytes.data(),
                                static_cast<int>(bytes.size()));
  out.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return fin_string(out);
}
