#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace fliprpc {

class StreamReader;

constexpr size_t MAX_VARINT_LEN = 10;

struct Varint {
  uint64_t value = 0;
  size_t consumed = 0;
};

// Number of bytes encode_varint() produces for `value`.
size_t varint_length(uint64_t value);

// Base-128, least significant group first, MSB set on every byte but the
// last. `out` must hold MAX_VARINT_LEN bytes. Returns bytes written.
size_t encode_varint(uint64_t value, uint8_t* out);
std::vector<uint8_t> encode_varint(uint64_t value);

// Parses a varint from the front of `data`. Returns nullopt when `data` ends
// before the terminating byte. Throws MalformedVarint when no terminator
// appears within MAX_VARINT_LEN bytes or the value overflows 64 bits.
std::optional<Varint> parse_varint(const uint8_t* data, size_t len);

// One read per byte until the terminator. Up to MAX_VARINT_LEN reads.
Varint decode_varint_slow(StreamReader& reader);

// Reads into a stack buffer that covers the longest varint plus one byte of
// look-ahead, parses in memory and hands bytes after the varint back to the
// reader. Usually a single read covers the length and the first payload byte.
Varint decode_varint_fast(StreamReader& reader);

}  // namespace fliprpc
