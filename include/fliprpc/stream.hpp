#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace fliprpc {

// Blocking byte stream the session talks through. Implementations report
// failures by throwing fliprpc::Error.
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  // Waits up to `timeout` for data and reads at most `len` bytes.
  // Returns 0 when nothing arrived in time.
  virtual size_t read_some(uint8_t* buf, size_t len,
                           std::chrono::milliseconds timeout) = 0;

  // Writes every byte or throws.
  virtual void write_all(const uint8_t* data, size_t len) = 0;
};

// ByteStream over an owned POSIX file descriptor (tty, pipe, socket).
class FdStream : public ByteStream {
 public:
  explicit FdStream(int fd);
  ~FdStream() override;

  FdStream(const FdStream&) = delete;
  FdStream& operator=(const FdStream&) = delete;

  size_t read_some(uint8_t* buf, size_t len,
                   std::chrono::milliseconds timeout) override;
  void write_all(const uint8_t* data, size_t len) override;

  void close();

 protected:
  int fd_ = -1;
};

}  // namespace fliprpc
