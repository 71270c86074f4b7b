#include "fliprpc/handshake.hpp"

#include <iostream>

#include "fliprpc/error.hpp"
#include "fliprpc/protocol.hpp"

namespace fliprpc {

const char* handshake_state_name(Handshake::State state) {
  switch (state) {
    case Handshake::State::Disconnected:
      return "disconnected";
    case Handshake::State::Draining:
      return "draining";
    case Handshake::State::ModeCommandSent:
      return "mode command sent";
    case Handshake::State::ConfirmingAccept:
      return "confirming accept";
    case Handshake::State::Ready:
      return "ready";
    case Handshake::State::Failed:
      return "failed";
  }
  return "unknown";
}

Handshake::Handshake(StreamReader& reader, bool verbose)
    : reader_(reader), verbose_(verbose) {}

void Handshake::enter(State next) {
  state_ = next;
  if (verbose_) {
    std::cerr << "handshake: " << handshake_state_name(next) << "\n";
  }
}

void Handshake::run() {
  if (state_ != State::Disconnected) {
    throw Error(ErrorKind::InvalidArgument,
                std::string("handshake already ") +
                    handshake_state_name(state_));
  }

  try {
    // Stale output from an earlier session may sit in the device buffer;
    // the prompt is the only reliable start position.
    enter(State::Draining);
    reader_.drain_until(SHELL_PROMPT);

    // "\r" only: the shell rejects the command when "\r\n" is sent.
    enter(State::ModeCommandSent);
    reader_.write_all(START_RPC_COMMAND);

    enter(State::ConfirmingAccept);
    reader_.drain_until(RPC_ACCEPTED);

    enter(State::Ready);
  } catch (const Error&) {
    enter(State::Failed);
    throw;
  }
}

}  // namespace fliprpc
