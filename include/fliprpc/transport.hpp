#pragma once

#include <memory>

#include "frame.hpp"
#include "protocol.hpp"
#include "reader.hpp"

namespace fliprpc {

// Moves envelopes to and from the device. Sessions are written against this
// interface; the serial implementation is one choice of backend.
class Transport {
 public:
  virtual ~Transport() = default;

  virtual void send(const Envelope& envelope) = 0;
  virtual Envelope receive() = 0;
};

// Length-delimited protobuf envelopes over a byte stream already in RPC mode.
class RpcTransport : public Transport {
 public:
  RpcTransport(StreamReader reader, VarintDecode decode = VarintDecode::Fast,
               bool verbose = false);

  RpcTransport(const RpcTransport&) = delete;
  RpcTransport& operator=(const RpcTransport&) = delete;

  void send(const Envelope& envelope) override;
  Envelope receive() override;

 private:
  StreamReader reader_;
  FrameTransport frames_;
  bool verbose_;
};

}  // namespace fliprpc
