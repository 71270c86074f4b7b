#pragma once

#include "reader.hpp"

namespace fliprpc {

// Switches the device from its text shell into RPC mode.
//
//   Disconnected -> Draining -> ModeCommandSent -> ConfirmingAccept -> Ready
//
// Any error moves the handshake to Failed and is rethrown. There is no retry;
// the caller discards the stream and reconnects.
class Handshake {
 public:
  enum class State {
    Disconnected,
    Draining,
    ModeCommandSent,
    ConfirmingAccept,
    Ready,
    Failed,
  };

  explicit Handshake(StreamReader& reader, bool verbose = false);

  void run();

  State state() const { return state_; }

 private:
  void enter(State next);

  StreamReader& reader_;
  bool verbose_;
  State state_ = State::Disconnected;
};

const char* handshake_state_name(Handshake::State state);

}  // namespace fliprpc
