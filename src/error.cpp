#include "fliprpc/error.hpp"

namespace fliprpc {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Io:
      return "io";
    case ErrorKind::Timeout:
      return "timeout";
    case ErrorKind::MalformedVarint:
      return "malformed varint";
    case ErrorKind::Decode:
      return "decode";
    case ErrorKind::ProtocolDesync:
      return "protocol desync";
    case ErrorKind::CommandIndexExhausted:
      return "command index exhausted";
    case ErrorKind::UnexpectedResponse:
      return "unexpected response";
    case ErrorKind::InvalidArgument:
      return "invalid argument";
    case ErrorKind::InvalidData:
      return "invalid data";
  }
  return "unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message),
      kind_(kind) {}

bool Error::is_fatal() const {
  switch (kind_) {
    case ErrorKind::Io:
    case ErrorKind::MalformedVarint:
    case ErrorKind::Decode:
    case ErrorKind::ProtocolDesync:
    case ErrorKind::CommandIndexExhausted:
      return true;
    // Only raised while no frame is partly read.
    case ErrorKind::Timeout:
    case ErrorKind::UnexpectedResponse:
    case ErrorKind::InvalidArgument:
    case ErrorKind::InvalidData:
      return false;
  }
  return true;
}

std::string command_status_message(PB::CommandStatus status) {
  switch (status) {
    case PB::OK:
      return "ok";
    case PB::ERROR:
      return "unknown error";
    case PB::ERROR_DECODE:
      return "decode error";
    case PB::ERROR_NOT_IMPLEMENTED:
      return "not implemented";
    case PB::ERROR_BUSY:
      return "busy";
    case PB::ERROR_CONTINUOUS_COMMAND_INTERRUPTED:
      return "continuous command interrupted";
    case PB::ERROR_INVALID_PARAMETERS:
      return "invalid RPC parameters";
    case PB::ERROR_STORAGE_NOT_READY:
      return "filesystem is not ready for use";
    case PB::ERROR_STORAGE_EXIST:
      return "file/dir already exists";
    case PB::ERROR_STORAGE_NOT_EXIST:
      return "file/dir not found";
    case PB::ERROR_STORAGE_INVALID_PARAMETER:
      return "invalid storage parameter";
    case PB::ERROR_STORAGE_DENIED:
      return "permission denied";
    case PB::ERROR_STORAGE_INVALID_NAME:
      return "invalid name/path";
    case PB::ERROR_STORAGE_INTERNAL:
      return "internal storage error";
    case PB::ERROR_STORAGE_NOT_IMPLEMENTED:
      return "storage function not implemented";
    case PB::ERROR_STORAGE_ALREADY_OPEN:
      return "already open";
    case PB::ERROR_STORAGE_DIR_NOT_EMPTY:
      return "directory not empty";
    case PB::ERROR_APP_CANT_START:
      return "unable to start app";
    case PB::ERROR_APP_SYSTEM_LOCKED:
      return "system locked, another app is already running";
    case PB::ERROR_APP_NOT_RUNNING:
      return "rpc is unavailable for app";
    case PB::ERROR_APP_CMD_ERROR:
      return "command execution error";
    case PB::ERROR_VIRTUAL_DISPLAY_ALREADY_STARTED:
      return "virtual display session already started";
    case PB::ERROR_VIRTUAL_DISPLAY_NOT_STARTED:
      return "virtual display session not started";
    case PB::ERROR_GPIO_MODE_INCORRECT:
      return "incorrect pin mode";
    case PB::ERROR_GPIO_UNKNOWN_PIN_MODE:
      return "unknown pin mode";
    default:
      break;
  }
  return "unrecognized status " + std::to_string(static_cast<int>(status));
}

Status Status::device_error(PB::CommandStatus status) {
  return Status(Code::DeviceError, status,
                command_status_message(status) + " (" +
                    PB::CommandStatus_Name(status) + ")");
}

Status Status::verification_mismatch(const std::string& expected,
                                     const std::string& actual) {
  return Status(Code::VerificationMismatch, PB::OK,
                "md5 mismatch: local " + expected + ", device " + actual);
}

std::string Status::to_string() const {
  switch (code_) {
    case Code::Ok:
      return "ok";
    case Code::DeviceError:
      return "device: " + message_;
    case Code::VerificationMismatch:
      return "verification: " + message_;
  }
  return message_;
}

}  // namespace fliprpc
