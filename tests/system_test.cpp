#include <gtest/gtest.h>

#include "fake_device.hpp"
#include "fliprpc/session.hpp"
#include "fliprpc/system.hpp"

using fliprpc_test::FakeDevice;
using fliprpc_test::MockTransport;
using fliprpc_test::reply;

namespace {

fliprpc::SessionOptions quick_options() {
  fliprpc::SessionOptions options;
  options.timeout = std::chrono::milliseconds(2000);
  return options;
}

}  // namespace

TEST(SystemTest, DeviceInfoGathersEveryFrame) {
  FakeDevice device;
  device.set_device_info({{"hardware_name", "Flipper"},
                          {"firmware_version", "0.98.3"},
                          {"radio_alive", "true"}});
  device.start(false);

  auto session = fliprpc::Session::attach(device.host_stream(), quick_options());
  auto info = fliprpc::System(session).device_info();

  ASSERT_TRUE(info.ok());
  EXPECT_EQ(info.value->size(), 3u);
  EXPECT_EQ(info.value->at("hardware_name"), "Flipper");
  EXPECT_EQ(info.value->at("firmware_version"), "0.98.3");
}

TEST(SystemTest, ProtobufVersion) {
  FakeDevice device;
  device.start(false);

  auto session = fliprpc::Session::attach(device.host_stream(), quick_options());
  auto version = fliprpc::System(session).protobuf_version();

  ASSERT_TRUE(version.ok());
  EXPECT_EQ(version.value->major, 0u);
  EXPECT_EQ(version.value->minor, 24u);
}

TEST(SystemTest, PingEchoesEmptyPayload) {
  FakeDevice device;
  device.start(false);

  auto session = fliprpc::Session::attach(device.host_stream(), quick_options());
  auto echoed = fliprpc::System(session).ping({});

  ASSERT_TRUE(echoed.ok());
  EXPECT_TRUE(echoed.value->empty());
}

TEST(SystemTest, WrongContentIsUnexpected) {
  auto log = std::make_shared<MockTransport::Log>();
  auto bad = reply(0);
  bad.mutable_storage_md5sum_response()->set_md5sum("x");
  log->replies = {bad};

  fliprpc::Session session(std::make_unique<MockTransport>(log));
  try {
    fliprpc::System(session).ping({1});
    FAIL() << "expected UnexpectedResponse";
  } catch (const fliprpc::Error& e) {
    EXPECT_EQ(e.kind(), fliprpc::ErrorKind::UnexpectedResponse);
    EXPECT_FALSE(e.is_fatal());
  }
  EXPECT_TRUE(session.usable());
}

TEST(SystemTest, DeviceErrorIsReturned) {
  auto log = std::make_shared<MockTransport::Log>();
  log->replies = {reply(0, false, PB::ERROR_NOT_IMPLEMENTED)};

  fliprpc::Session session(std::make_unique<MockTransport>(log));
  auto version = fliprpc::System(session).protobuf_version();

  EXPECT_FALSE(version.ok());
  EXPECT_FALSE(version.value.has_value());
  EXPECT_EQ(version.status.command_status(), PB::ERROR_NOT_IMPLEMENTED);
}
