#pragma once

#include <memory>
#include <string>

#include "stream.hpp"

namespace fliprpc {

constexpr int DEFAULT_BAUD = 115200;

// Raw 8N1 tty. The CDC-ACM driver ignores the baud rate, but it is still
// applied so plain UART bridges behave.
class SerialPort : public FdStream {
 public:
  static std::unique_ptr<SerialPort> open(const std::string& path,
                                          int baud = DEFAULT_BAUD,
                                          bool verbose = false);

 private:
  explicit SerialPort(int fd);
};

}  // namespace fliprpc
