#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "stream.hpp"

namespace fliprpc {

constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{10000};

// Buffered reader over a ByteStream. Bytes read past what a caller needed
// (varint look-ahead, shell output after a prompt) are kept in a small
// read-ahead buffer and served before the stream is touched again.
class StreamReader {
 public:
  static constexpr size_t DRAIN_CHUNK = 256;
  static constexpr size_t READ_AHEAD_LIMIT = 2 * DRAIN_CHUNK;
  static constexpr size_t COLLECT_LIMIT = 64 * 1024;

  explicit StreamReader(std::unique_ptr<ByteStream> stream,
                        std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

  StreamReader(StreamReader&&) = default;
  StreamReader& operator=(StreamReader&&) = default;

  // Returns between 1 and `len` bytes. Serves the read-ahead first, otherwise
  // issues one stream read. Throws Timeout if nothing arrives in time.
  size_t read_some(uint8_t* buf, size_t len);

  // Reads exactly `len` bytes or throws Timeout/Io.
  void read_exact(uint8_t* buf, size_t len);
  std::vector<uint8_t> read_exact(size_t len);

  // Discards input until `marker` has been seen. The whole search is bounded
  // by the configured timeout. Input following the marker is kept.
  void drain_until(const std::string& marker);

  // Like drain_until, but returns the input that preceded `marker`. More
  // than COLLECT_LIMIT bytes without the marker is an Io error.
  std::string read_until(const std::string& marker);

  // Puts bytes back in front of the read-ahead.
  void unread(const uint8_t* data, size_t len);

  void write_all(const uint8_t* data, size_t len);
  void write_all(const std::string& text);

  size_t buffered() const { return read_ahead_.size(); }
  std::chrono::milliseconds timeout() const { return timeout_; }
  void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

 private:
  size_t take_buffered(uint8_t* buf, size_t len);
  void scan_until(const std::string& marker, std::string* collected);

  std::unique_ptr<ByteStream> stream_;
  std::chrono::milliseconds timeout_;
  std::vector<uint8_t> read_ahead_;
};

}  // namespace fliprpc
