#include <gtest/gtest.h>

#include "fake_device.hpp"
#include "fliprpc/error.hpp"
#include "fliprpc/shell.hpp"
#include "fliprpc/system.hpp"

using fliprpc::ErrorKind;
using fliprpc::ShellSession;
using fliprpc_test::FakeDevice;
using fliprpc_test::ScriptedStream;
using fliprpc_test::StreamScript;

namespace {

class ShellTest : public ::testing::Test {
 protected:
  void SetUp() override {
    options_.timeout = std::chrono::milliseconds(2000);
    device_.set_shell_output("led g 255", "");
    device_.set_shell_output("uptime", "Uptime: 0h0m5s");
    device_.start();
  }

  FakeDevice device_;
  fliprpc::SessionOptions options_;
};

}  // namespace

TEST_F(ShellTest, RunsCommandsThenSwitchesToRpc) {
  {
    auto shell = ShellSession::connect(device_.host_stream(), options_);
    EXPECT_EQ(shell.run("led g 255"), "");
    EXPECT_EQ(shell.run("uptime"), "Uptime: 0h0m5s");

    auto session = shell.into_rpc();
    auto echoed = fliprpc::System(session).ping({1, 2});
    ASSERT_TRUE(echoed.ok());
    EXPECT_EQ(*echoed.value, std::vector<uint8_t>({1, 2}));
  }
  device_.join();

  EXPECT_EQ(device_.shell_commands(),
            std::vector<std::string>(
                {"led g 255", "uptime", "start_rpc_session"}));
}

TEST_F(ShellTest, UnknownCommandPrintsNotFound) {
  auto shell = ShellSession::connect(device_.host_stream(), options_);
  EXPECT_EQ(shell.run("frobnicate"), "Command not found");
  EXPECT_EQ(shell.run("uptime"), "Uptime: 0h0m5s");
}

TEST_F(ShellTest, UnreadOutputIsSkipped) {
  auto shell = ShellSession::connect(device_.host_stream(), options_);
  shell.send_command("uptime");
  shell.send_command("led g 255");
  EXPECT_EQ(shell.read_output(), "");

  // into_rpc also skips output nobody read.
  shell.send_command("uptime");
  auto session = shell.into_rpc();
  EXPECT_TRUE(fliprpc::System(session).ping({9}).ok());
}

TEST_F(ShellTest, HandedOverShellRefusesCommands) {
  auto shell = ShellSession::connect(device_.host_stream(), options_);
  auto session = shell.into_rpc();

  try {
    shell.send_command("uptime");
    FAIL() << "expected InvalidArgument";
  } catch (const fliprpc::Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
  }
  EXPECT_TRUE(fliprpc::System(session).ping({}).ok());
}

TEST(ShellScriptTest, CommandsAreSingleLinesEndedByCarriageReturn) {
  auto script = std::make_shared<StreamScript>();
  script->feed("Flipper Zero Command Line Interface!\r\n\r\n>: ");
  script->feed("\r\nLED set\r\n\r\n>: ");

  fliprpc::SessionOptions options;
  options.timeout = std::chrono::milliseconds(100);
  auto shell =
      ShellSession::connect(std::make_unique<ScriptedStream>(script), options);

  EXPECT_THROW(shell.read_output(), fliprpc::Error);
  EXPECT_THROW(shell.send_command(""), fliprpc::Error);
  EXPECT_THROW(shell.send_command("led g 255\r\nled r 0"), fliprpc::Error);
  EXPECT_TRUE(script->written.empty());

  EXPECT_EQ(shell.run("led g 255"), "LED set");
  EXPECT_EQ(script->written_text(), "led g 255\r");
}

TEST(ShellScriptTest, MissingPromptTimesOut) {
  auto script = std::make_shared<StreamScript>();
  script->feed("booting...\r\n");

  fliprpc::SessionOptions options;
  options.timeout = std::chrono::milliseconds(100);
  try {
    ShellSession::connect(std::make_unique<ScriptedStream>(script), options);
    FAIL() << "expected Timeout";
  } catch (const fliprpc::Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Timeout);
  }
}
