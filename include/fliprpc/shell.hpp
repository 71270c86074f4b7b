#pragma once

#include <memory>
#include <string>

#include "reader.hpp"
#include "serial_port.hpp"
#include "session.hpp"

namespace fliprpc {

// The device's text shell, for commands that have no RPC counterpart
// ("led g 255", "power reboot"). Between calls the reader sits just before
// a prompt, so the session can be handed over to RPC mode at any point.
class ShellSession {
 public:
  // Opens the serial port and waits for the shell prompt.
  static ShellSession open(const std::string& port,
                           const SessionOptions& options = SessionOptions(),
                           int baud = DEFAULT_BAUD);

  static ShellSession connect(std::unique_ptr<ByteStream> stream,
                              const SessionOptions& options = SessionOptions());

  ShellSession(ShellSession&&) = default;
  ShellSession& operator=(ShellSession&&) = default;

  // Sends one command line, terminated with "\r" only. Output of an earlier
  // command that was never read is discarded first.
  void send_command(const std::string& command);

  // Text the last command printed before the next prompt, with the line
  // breaks around it trimmed.
  std::string read_output();

  // send_command followed by read_output.
  std::string run(const std::string& command);

  // Switches the device into RPC mode and hands the stream to a Session.
  // The shell session is empty afterwards.
  Session into_rpc();

 private:
  ShellSession(StreamReader reader, const SessionOptions& options);

  void ensure_open() const;

  std::unique_ptr<StreamReader> reader_;
  SessionOptions options_;
  bool output_pending_ = false;
};

}  // namespace fliprpc
