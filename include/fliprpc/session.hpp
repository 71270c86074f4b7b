#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "error.hpp"
#include "frame.hpp"
#include "protocol.hpp"
#include "serial_port.hpp"
#include "transport.hpp"

namespace fliprpc {

constexpr size_t DEFAULT_CHUNK_SIZE = 512;
constexpr std::chrono::milliseconds DEFAULT_KEEPALIVE_INTERVAL{5000};

struct SessionOptions {
  std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
  size_t chunk_size = DEFAULT_CHUNK_SIZE;
  bool prefetch_metadata = false;
  bool keepalive = true;
  std::chrono::milliseconds keepalive_interval = DEFAULT_KEEPALIVE_INTERVAL;
  VarintDecode varint_decode = VarintDecode::Fast;
  bool verbose = false;
  // Id handed to the first exchange. Sessions resumed on a stream that
  // already carried traffic start past the ids in flight.
  uint64_t first_command_id = 0;
};

// A fully received exchange.
struct Response {
  uint32_t command_id = 0;
  Status status;
  std::vector<Envelope> frames;

  bool ok() const { return status.is_ok(); }
};

using FrameHandler = std::function<void(const Envelope&)>;

// One RPC session on one stream. Exchanges are strictly sequential; callers
// that share a session across threads must serialize access themselves.
class Session {
 public:
  // Opens the serial port and runs the handshake.
  static Session open(const std::string& port,
                      const SessionOptions& options = SessionOptions(),
                      int baud = DEFAULT_BAUD);

  // Runs the handshake over an arbitrary stream.
  static Session connect(std::unique_ptr<ByteStream> stream,
                         const SessionOptions& options = SessionOptions());

  // Wraps a stream that is already in RPC mode.
  static Session attach(std::unique_ptr<ByteStream> stream,
                        const SessionOptions& options = SessionOptions());

  explicit Session(std::unique_ptr<Transport> transport,
                   const SessionOptions& options = SessionOptions());

  Session(Session&&) = default;
  Session& operator=(Session&&) = default;

  // Allocates the command id for a new exchange.
  uint32_t begin_exchange();

  // Id the next exchange will get.
  uint64_t command_index() const { return next_id_; }

  // Sends one frame of the exchange `command_id`.
  void send(Envelope envelope, uint32_t command_id, bool has_next = false);

  // Reads frames of `command_id` until one arrives with has_next == false.
  // `on_frame` sees each frame in order until the device reports an error;
  // the rest of the chain is still consumed so the stream stays aligned.
  // Throws ProtocolDesync when a frame carries any other id.
  Status receive_chain(uint32_t command_id, const FrameHandler& on_frame);

  // Single-request exchanges.
  Response exchange(Envelope request);
  Status exchange(Envelope request, const FrameHandler& on_frame);

  // Sends a request the device never answers (stop_session).
  void notify(Envelope request);

  const SessionOptions& options() const { return options_; }
  bool usable() const { return !broken_; }

  // Time the device last answered (or the session was created).
  std::chrono::steady_clock::time_point last_receive() const {
    return last_receive_;
  }

 private:
  void ensure_usable() const;
  void mark_if_fatal(const Error& e);

  std::unique_ptr<Transport> transport_;
  SessionOptions options_;
  uint64_t next_id_;
  bool broken_ = false;
  std::chrono::steady_clock::time_point last_receive_;
};

}  // namespace fliprpc
