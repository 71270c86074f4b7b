#pragma once

#include <cstdint>
#include <vector>

namespace fliprpc {

class StreamReader;

// Upper bound on an incoming payload. A larger length prefix means the
// stream position is lost.
constexpr uint64_t MAX_FRAME_BYTES = 1024u * 1024u;

enum class VarintDecode { Fast, Slow };

// Build a complete frame: <varint length><payload>
std::vector<uint8_t> build_frame(const std::vector<uint8_t>& payload);

// Moves one length-prefixed payload at a time. Nothing is read ahead beyond
// what the varint decoder hands back to the reader.
class FrameTransport {
 public:
  explicit FrameTransport(StreamReader& reader,
                          VarintDecode decode = VarintDecode::Fast);

  // Writes length and payload in a single write. Any failure is fatal for
  // the session.
  void send(const std::vector<uint8_t>& payload);

  // Returns the next complete payload.
  std::vector<uint8_t> receive();

 private:
  StreamReader& reader_;
  VarintDecode decode_;
};

}  // namespace fliprpc
