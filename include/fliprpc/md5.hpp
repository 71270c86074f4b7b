#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace fliprpc {

// Incremental MD5 over OpenSSL's EVP interface. The device reports hashes
// as 32 lowercase hex digits, and so does hex_digest().
class Md5 {
 public:
  Md5();
  ~Md5();

  Md5(const Md5&) = delete;
  Md5& operator=(const Md5&) = delete;

  void update(const uint8_t* data, size_t len);

  // Finishes the digest. The object cannot be updated afterwards.
  std::string hex_digest();

  static std::string hex(const uint8_t* data, size_t len);
  static std::string hex(const std::vector<uint8_t>& data) {
    return hex(data.data(), data.size());
  }

 private:
  evp_md_ctx_st* ctx_;
  bool finished_ = false;
};

}  // namespace fliprpc
