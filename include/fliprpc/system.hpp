#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "session.hpp"

namespace fliprpc {

struct ProtobufVersion {
  uint32_t major = 0;
  uint32_t minor = 0;
};

// System commands that are not tied to storage.
class System {
 public:
  explicit System(Session& session) : session_(session) {}

  // The device echoes `data` back.
  Result<std::vector<uint8_t>> ping(const std::vector<uint8_t>& data);

  // The device streams one key/value pair per frame.
  Result<std::map<std::string, std::string>> device_info();

  Result<ProtobufVersion> protobuf_version();

  // Returns the device to its text shell. The device does not answer, and
  // the session must not be used afterwards.
  void stop_session();

 private:
  Session& session_;
};

}  // namespace fliprpc
