#include "fliprpc/md5.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace fliprpc {

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

Md5::~Md5() { EVP_MD_CTX_free(ctx_); }

void Md5::update(const uint8_t* data, size_t len) {
  if (finished_) {
    throw std::logic_error("Md5::update after hex_digest");
  }
  if (len == 0) {
    return;
  }
  if (EVP_DigestUpdate(ctx_, data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string Md5::hex_digest() {
  if (finished_) {
    throw std::logic_error("Md5::hex_digest called twice");
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finished_ = true;

  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[digest[i] >> 4]);
    out.push_back(kHex[digest[i] & 0x0f]);
  }
  return out;
}

std::string Md5::hex(const uint8_t* data, size_t len) {
  Md5 md5;
  md5.update(data, len);
  return md5.hex_digest();
}

}  // namespace fliprpc
