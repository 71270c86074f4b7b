#include "fliprpc/frame.hpp"

#include <string>

#include "fliprpc/error.hpp"
#include "fliprpc/reader.hpp"
#include "fliprpc/varint.hpp"

namespace fliprpc {

std::vector<uint8_t> build_frame(const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> frame;
  frame.reserve(varint_length(payload.size()) + payload.size());

  uint8_t prefix[MAX_VARINT_LEN];
  size_t n = encode_varint(payload.size(), prefix);
  frame.insert(frame.end(), prefix, prefix + n);
  frame.insert(frame.end(), payload.begin(), payload.end());

  return frame;
}

FrameTransport::FrameTransport(StreamReader& reader, VarintDecode decode)
    : reader_(reader), decode_(decode) {}

void FrameTransport::send(const std::vector<uint8_t>& payload) {
  auto frame = build_frame(payload);
  reader_.write_all(frame.data(), frame.size());
}

std::vector<uint8_t> FrameTransport::receive() {
  Varint length = decode_ == VarintDecode::Fast ? decode_varint_fast(reader_)
                                                : decode_varint_slow(reader_);

  if (length.value > MAX_FRAME_BYTES) {
    throw Error(ErrorKind::Io, "frame length " + std::to_string(length.value) +
                                   " exceeds limit");
  }

  // Once the prefix is consumed, a partial payload cannot be put back and
  // the next read would start mid-frame.
  try {
    return reader_.read_exact(static_cast<size_t>(length.value));
  } catch (const Error& e) {
    if (e.kind() != ErrorKind::Timeout) {
      throw;
    }
    throw Error(ErrorKind::Io, "timed out inside a " +
                                   std::to_string(length.value) +
                                   " byte frame: " + e.what());
  }
}

}  // namespace fliprpc
