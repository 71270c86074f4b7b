#include "fliprpc/system.hpp"

namespace fliprpc {

namespace {

void expect_content(const Envelope& frame, Envelope::ContentCase expected,
                    const char* what) {
  if (frame.content_case() != expected) {
    throw Error(ErrorKind::UnexpectedResponse,
                std::string("expected ") + what + ", received " +
                    content_name(frame));
  }
}

}  // namespace

Result<std::vector<uint8_t>> System::ping(const std::vector<uint8_t>& data) {
  auto response = session_.exchange(ping_request(data));
  if (!response.ok()) {
    return Result<std::vector<uint8_t>>::failure(response.status);
  }

  const auto& frame = response.frames.back();
  expect_content(frame, Envelope::kSystemPingResponse, "ping response");

  const std::string& echoed = frame.system_ping_response().data();
  return Result<std::vector<uint8_t>>::success(
      std::vector<uint8_t>(echoed.begin(), echoed.end()));
}

Result<std::map<std::string, std::string>> System::device_info() {
  std::map<std::string, std::string> info;
  bool unexpected = false;

  Status status =
      session_.exchange(device_info_request(), [&](const Envelope& frame) {
        if (frame.content_case() != Envelope::kSystemDeviceInfoResponse) {
          unexpected = true;
          return;
        }
        const auto& pair = frame.system_device_info_response();
        info[pair.key()] = pair.value();
      });

  if (!status.is_ok()) {
    return Result<std::map<std::string, std::string>>::failure(status);
  }
  if (unexpected) {
    throw Error(ErrorKind::UnexpectedResponse,
                "device info chain carried other content");
  }
  return Result<std::map<std::string, std::string>>::success(std::move(info));
}

Result<ProtobufVersion> System::protobuf_version() {
  auto response = session_.exchange(protobuf_version_request());
  if (!response.ok()) {
    return Result<ProtobufVersion>::failure(response.status);
  }

  const auto& frame = response.frames.back();
  expect_content(frame, Envelope::kSystemProtobufVersionResponse,
                 "protobuf version response");

  ProtobufVersion version;
  version.major = frame.system_protobuf_version_response().major_version();
  version.minor = frame.system_protobuf_version_response().minor_version();
  return Result<ProtobufVersion>::success(version);
}

void System::stop_session() {
  session_.notify(stop_session_request());
}

}  // namespace fliprpc
