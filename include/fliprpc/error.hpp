#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "flipper.pb.h"

namespace fliprpc {

// Transport and framing failures. These leave the byte stream in an unknown
// position, so they are thrown rather than returned.
enum class ErrorKind {
  Io,
  Timeout,
  MalformedVarint,
  Decode,
  ProtocolDesync,
  CommandIndexExhausted,
  UnexpectedResponse,
  InvalidArgument,
  InvalidData,
};

const char* error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& message);

  ErrorKind kind() const { return kind_; }

  // True when the session that raised this error must be discarded.
  bool is_fatal() const;

 private:
  ErrorKind kind_;
};

// Human readable text for a device command status.
std::string command_status_message(PB::CommandStatus status);

// Outcome of an operation the device completed. Device-side failures and
// post-write hash mismatches are ordinary values callers branch on.
class Status {
 public:
  enum class Code { Ok, DeviceError, VerificationMismatch };

  Status() = default;

  static Status ok() { return Status(); }
  static Status device_error(PB::CommandStatus status);
  static Status verification_mismatch(const std::string& expected,
                                      const std::string& actual);

  bool is_ok() const { return code_ == Code::Ok; }
  Code code() const { return code_; }
  PB::CommandStatus command_status() const { return command_status_; }
  const std::string& message() const { return message_; }

  std::string to_string() const;

 private:
  Status(Code code, PB::CommandStatus status, std::string message)
      : code_(code), command_status_(status), message_(std::move(message)) {}

  Code code_ = Code::Ok;
  PB::CommandStatus command_status_ = PB::OK;
  std::string message_;
};

template <typename T>
struct Result {
  Status status;
  std::optional<T> value;

  bool ok() const { return status.is_ok(); }

  static Result success(T v) { return Result{Status::ok(), std::move(v)}; }
  static Result failure(Status s) { return Result{std::move(s), std::nullopt}; }
};

}  // namespace fliprpc
