#include "fliprpc/shell.hpp"

#include <iostream>
#include <vector>

#include "fliprpc/error.hpp"
#include "fliprpc/handshake.hpp"
#include "fliprpc/protocol.hpp"

namespace fliprpc {

namespace {

// Leaves the prompt in the read-ahead so the next drain finds it at once.
void keep_prompt(StreamReader& reader) {
  const std::string prompt = SHELL_PROMPT;
  std::vector<uint8_t> data(prompt.begin(), prompt.end());
  reader.unread(data.data(), data.size());
}

std::string trim_lines(const std::string& text) {
  size_t begin = text.find_first_not_of("\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of("\r\n");
  return text.substr(begin, end - begin + 1);
}

}  // namespace

ShellSession ShellSession::open(const std::string& port,
                                const SessionOptions& options, int baud) {
  return connect(SerialPort::open(port, baud, options.verbose), options);
}

ShellSession ShellSession::connect(std::unique_ptr<ByteStream> stream,
                                   const SessionOptions& options) {
  StreamReader reader(std::move(stream), options.timeout);
  reader.drain_until(SHELL_PROMPT);
  keep_prompt(reader);
  return ShellSession(std::move(reader), options);
}

ShellSession::ShellSession(StreamReader reader, const SessionOptions& options)
    : reader_(std::make_unique<StreamReader>(std::move(reader))),
      options_(options) {}

void ShellSession::ensure_open() const {
  if (!reader_) {
    throw Error(ErrorKind::InvalidArgument,
                "shell session was handed over to RPC mode");
  }
}

void ShellSession::send_command(const std::string& command) {
  ensure_open();
  if (command.empty() || command.find_first_of("\r\n") != std::string::npos) {
    throw Error(ErrorKind::InvalidArgument,
                "shell command must be one non-empty line");
  }

  if (output_pending_) {
    read_output();
  }
  reader_->drain_until(SHELL_PROMPT);

  if (options_.verbose) {
    std::cerr << "shell: " << command << "\n";
  }
  reader_->write_all(command + "\r");
  output_pending_ = true;
}

std::string ShellSession::read_output() {
  ensure_open();
  if (!output_pending_) {
    throw Error(ErrorKind::InvalidArgument, "no command awaiting output");
  }

  std::string text = reader_->read_until(SHELL_PROMPT);
  keep_prompt(*reader_);
  output_pending_ = false;
  return trim_lines(text);
}

std::string ShellSession::run(const std::string& command) {
  send_command(command);
  return read_output();
}

Session ShellSession::into_rpc() {
  ensure_open();
  if (output_pending_) {
    read_output();
  }

  Handshake handshake(*reader_, options_.verbose);
  handshake.run();

  auto transport = std::make_unique<RpcTransport>(
      std::move(*reader_), options_.varint_decode, options_.verbose);
  reader_.reset();
  return Session(std::move(transport), options_);
}

}  // namespace fliprpc
