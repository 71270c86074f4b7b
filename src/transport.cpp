#include "fliprpc/transport.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace fliprpc {

namespace {

constexpr size_t HEX_DUMP_LIMIT = 64;

void dump_hex(const char* label, const std::vector<uint8_t>& bytes) {
  std::cerr << label;
  size_t n = std::min(bytes.size(), HEX_DUMP_LIMIT);
  for (size_t i = 0; i < n; ++i) {
    std::cerr << std::hex << std::uppercase << std::setfill('0')
              << std::setw(2) << static_cast<int>(bytes[i]);
  }
  if (bytes.size() > n) {
    std::cerr << "... (" << std::dec << bytes.size() << " bytes)";
  }
  std::cerr << std::dec << "\n";
}

}  // namespace

RpcTransport::RpcTransport(StreamReader reader, VarintDecode decode,
                           bool verbose)
    : reader_(std::move(reader)), frames_(reader_, decode), verbose_(verbose) {}

void RpcTransport::send(const Envelope& envelope) {
  auto payload = encode_envelope(envelope);

  if (verbose_) {
    std::cerr << "Sending: " << content_name(envelope)
              << " id=" << envelope.command_id()
              << " has_next=" << envelope.has_next() << "\n";
    dump_hex("Payload hex: ", payload);
  }

  frames_.send(payload);
}

Envelope RpcTransport::receive() {
  auto payload = frames_.receive();

  if (verbose_) {
    dump_hex("Response hex: ", payload);
  }

  auto envelope = decode_envelope(payload);

  if (verbose_) {
    std::cerr << "Received: " << content_name(envelope)
              << " id=" << envelope.command_id() << " status="
              << PB::CommandStatus_Name(envelope.command_status())
              << " has_next=" << envelope.has_next() << "\n";
  }

  return envelope;
}

}  // namespace fliprpc
