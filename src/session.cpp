#include "fliprpc/session.hpp"

#include <iostream>
#include <limits>

#include "fliprpc/handshake.hpp"

namespace fliprpc {

Session Session::open(const std::string& port, const SessionOptions& options,
                      int baud) {
  return connect(SerialPort::open(port, baud, options.verbose), options);
}

Session Session::connect(std::unique_ptr<ByteStream> stream,
                         const SessionOptions& options) {
  StreamReader reader(std::move(stream), options.timeout);

  Handshake handshake(reader, options.verbose);
  handshake.run();

  return Session(std::make_unique<RpcTransport>(
                     std::move(reader), options.varint_decode, options.verbose),
                 options);
}

Session Session::attach(std::unique_ptr<ByteStream> stream,
                        const SessionOptions& options) {
  StreamReader reader(std::move(stream), options.timeout);
  return Session(std::make_unique<RpcTransport>(
                     std::move(reader), options.varint_decode, options.verbose),
                 options);
}

Session::Session(std::unique_ptr<Transport> transport,
                 const SessionOptions& options)
    : transport_(std::move(transport)),
      options_(options),
      next_id_(options.first_command_id),
      last_receive_(std::chrono::steady_clock::now()) {}

void Session::ensure_usable() const {
  if (broken_) {
    throw Error(ErrorKind::Io, "session is unusable after a fatal error");
  }
}

void Session::mark_if_fatal(const Error& e) {
  if (e.is_fatal()) {
    broken_ = true;
  }
}

uint32_t Session::begin_exchange() {
  ensure_usable();

  // Wrapping would let a late frame of an old exchange pass as current.
  if (next_id_ > std::numeric_limits<uint32_t>::max()) {
    broken_ = true;
    throw Error(ErrorKind::CommandIndexExhausted,
                "all 2^32 command ids have been used");
  }
  return static_cast<uint32_t>(next_id_++);
}

void Session::send(Envelope envelope, uint32_t command_id, bool has_next) {
  ensure_usable();

  envelope.set_command_id(command_id);
  envelope.set_command_status(PB::OK);
  envelope.set_has_next(has_next);

  try {
    transport_->send(envelope);
  } catch (const Error&) {
    // A partial write leaves the device mid-frame.
    broken_ = true;
    throw;
  }
}

Status Session::receive_chain(uint32_t command_id,
                              const FrameHandler& on_frame) {
  ensure_usable();

  Status status;

  try {
    while (true) {
      Envelope frame = transport_->receive();
      last_receive_ = std::chrono::steady_clock::now();

      if (frame.command_id() != command_id) {
        broken_ = true;
        throw Error(ErrorKind::ProtocolDesync,
                    "expected command id " + std::to_string(command_id) +
                        ", received " + std::to_string(frame.command_id()) +
                        " (" + content_name(frame) + ")");
      }

      if (frame.command_status() != PB::OK && status.is_ok()) {
        status = Status::device_error(frame.command_status());
        if (options_.verbose) {
          std::cerr << "command " << command_id
                    << " failed: " << status.to_string() << "\n";
        }
      }

      if (status.is_ok() && on_frame) {
        on_frame(frame);
      }

      if (!frame.has_next()) {
        break;
      }
    }
  } catch (const Error& e) {
    mark_if_fatal(e);
    throw;
  }

  return status;
}

Response Session::exchange(Envelope request) {
  Response response;
  response.command_id = begin_exchange();

  send(std::move(request), response.command_id);
  response.status =
      receive_chain(response.command_id, [&response](const Envelope& frame) {
        response.frames.push_back(frame);
      });

  if (!response.ok()) {
    response.frames.clear();
  }
  return response;
}

Status Session::exchange(Envelope request, const FrameHandler& on_frame) {
  uint32_t id = begin_exchange();
  send(std::move(request), id);
  return receive_chain(id, on_frame);
}

void Session::notify(Envelope request) {
  uint32_t id = begin_exchange();
  send(std::move(request), id);
}

}  // namespace fliprpc
