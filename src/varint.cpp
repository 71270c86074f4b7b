#include "fliprpc/varint.hpp"

#include <array>
#include <string>

#include "fliprpc/error.hpp"
#include "fliprpc/reader.hpp"

namespace fliprpc {

size_t varint_length(uint64_t value) {
  size_t len = 1;
  while (value >= 0x80) {
    value >>= 7;
    ++len;
  }
  return len;
}

size_t encode_varint(uint64_t value, uint8_t* out) {
  size_t i = 0;
  while (value >= 0x80) {
    out[i++] = static_cast<uint8_t>((value & 0x7F) | 0x80);
    value >>= 7;
  }
  out[i++] = static_cast<uint8_t>(value);
  return i;
}

std::vector<uint8_t> encode_varint(uint64_t value) {
  std::array<uint8_t, MAX_VARINT_LEN> buf;
  size_t n = encode_varint(value, buf.data());
  return std::vector<uint8_t>(buf.begin(), buf.begin() + n);
}

std::optional<Varint> parse_varint(const uint8_t* data, size_t len) {
  uint64_t value = 0;

  for (size_t i = 0; i < len && i < MAX_VARINT_LEN; ++i) {
    uint8_t b = data[i];

    // The tenth byte carries bit 63 only.
    if (i == MAX_VARINT_LEN - 1 && b > 0x01) {
      throw Error(ErrorKind::MalformedVarint, "varint overflows 64 bits");
    }

    value |= static_cast<uint64_t>(b & 0x7F) << (7 * i);

    if ((b & 0x80) == 0) {
      return Varint{value, i + 1};
    }
  }

  if (len >= MAX_VARINT_LEN) {
    throw Error(ErrorKind::MalformedVarint,
                "no terminating byte within 10 bytes");
  }
  return std::nullopt;
}

Varint decode_varint_slow(StreamReader& reader) {
  std::array<uint8_t, MAX_VARINT_LEN> buf;

  for (size_t i = 0; i < MAX_VARINT_LEN; ++i) {
    try {
      reader.read_exact(&buf[i], 1);
    } catch (const Error& e) {
      if (i == 0 || e.kind() != ErrorKind::Timeout) {
        throw;
      }
      throw Error(ErrorKind::Io, std::string("timed out inside a length "
                                             "prefix: ") +
                                     e.what());
    }
    if ((buf[i] & 0x80) == 0) {
      auto parsed = parse_varint(buf.data(), i + 1);
      return *parsed;
    }
  }

  throw Error(ErrorKind::MalformedVarint,
              "no terminating byte within 10 bytes");
}

Varint decode_varint_fast(StreamReader& reader) {
  std::array<uint8_t, MAX_VARINT_LEN + 1> buf;
  size_t filled = 0;

  while (true) {
    try {
      filled += reader.read_some(buf.data() + filled, buf.size() - filled);
    } catch (const Error& e) {
      if (filled == 0 || e.kind() != ErrorKind::Timeout) {
        throw;
      }
      throw Error(ErrorKind::Io, std::string("timed out inside a length "
                                             "prefix: ") +
                                     e.what());
    }

    auto parsed = parse_varint(buf.data(), filled);
    if (parsed) {
      reader.unread(buf.data() + parsed->consumed, filled - parsed->consumed);
      return *parsed;
    }
    // parse_varint throws once MAX_VARINT_LEN bytes are buffered, so the
    // buffer always has room for another read here.
  }
}

}  // namespace fliprpc
