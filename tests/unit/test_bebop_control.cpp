#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "bebop_control.hpp"
#include "mock_platform.hpp"
#include "test_helpers.hpp"

using namespace bebop;
using namespace bebop::testing;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

const CommandDescriptor kTakeOff = BuiltinDescriptor("ardrone3", "Piloting",
                                                     "TakeOff");
const CommandDescriptor kLanding = BuiltinDescriptor("ardrone3", "Piloting",
                                                     "Landing");
const CommandDescriptor kAllStates = BuiltinDescriptor("common", "Common",
                                                       "AllStates");

class BebopControlTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(bebop.Connect(3)); }

  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  BebopControl bebop{platform, CommandTable::Builtin(), decoder};
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════

TEST(BebopControlConnectTest, ConnectRegistersSink) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  BebopControl bebop(platform, CommandTable::Builtin(), decoder);

  EXPECT_FALSE(bebop.IsConnected());
  ASSERT_TRUE(bebop.Connect(5));
  EXPECT_TRUE(bebop.IsConnected());
  EXPECT_EQ(platform.GetLastConnectRetries(), 5);
  EXPECT_NE(platform.GetSink(), nullptr);
}

TEST(BebopControlConnectTest, ConnectUsesConfiguredRetries) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  ControllerConfig config;
  config.connect_retries = 7;
  BebopControl bebop(platform, CommandTable::Builtin(), decoder, config);

  ASSERT_TRUE(bebop.Connect());
  EXPECT_EQ(platform.GetLastConnectRetries(), 7);
}

TEST(BebopControlConnectTest, ConnectFailure) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  BebopControl bebop(platform, CommandTable::Builtin(), decoder);
  platform.SetConnectResult(false);

  EXPECT_FALSE(bebop.Connect(3));
  EXPECT_FALSE(bebop.IsConnected());
  EXPECT_EQ(platform.GetSink(), nullptr)
      << "Sink must be unregistered after a failed connect";
  EXPECT_TRUE(platform.HasLog(LogLevel::Error, "Failed to connect"));
}

TEST(BebopControlConnectTest, DisconnectUnregistersSink) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  BebopControl bebop(platform, CommandTable::Builtin(), decoder);
  ASSERT_TRUE(bebop.Connect(1));

  bebop.Disconnect();

  EXPECT_FALSE(bebop.IsConnected());
  EXPECT_FALSE(platform.IsConnected());
  EXPECT_EQ(platform.GetSink(), nullptr);
}

TEST(BebopControlConnectTest, DestructorUnregistersSink) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  {
    BebopControl bebop(platform, CommandTable::Builtin(), decoder);
    ASSERT_TRUE(bebop.Connect(1));
  }
  EXPECT_EQ(platform.GetSink(), nullptr);
}

TEST(BebopControlConnectTest, CommandsRequireConnection) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  BebopControl bebop(platform, CommandTable::Builtin(), decoder);

  EXPECT_EQ(bebop.TakeOff(), ActionResult::NotConnected);
  EXPECT_EQ(bebop.FlyDirect(10, 0, 0, 0, 1.0), ActionResult::NotConnected);
  EXPECT_EQ(bebop.Flip("left"), ActionResult::NotConnected);
  EXPECT_TRUE(platform.GetSent().empty());
  EXPECT_TRUE(platform.GetSentPcmd().empty());
  EXPECT_TRUE(platform.GetSentEnum().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Direct Actions
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(BebopControlTest, TakeOffSendsOnce) {
  EXPECT_EQ(bebop.TakeOff(), ActionResult::Sent);
  ASSERT_EQ(platform.GetSent().size(), 1u);
  EXPECT_EQ(platform.GetSent()[0], kTakeOff);
}

TEST_F(BebopControlTest, LandSendsOnce) {
  EXPECT_EQ(bebop.Land(), ActionResult::Sent);
  EXPECT_EQ(platform.CountSent(kLanding), 1);
}

TEST_F(BebopControlTest, AskForStateUpdate) {
  EXPECT_EQ(bebop.AskForStateUpdate(), ActionResult::Sent);
  EXPECT_EQ(platform.CountSent(kAllStates), 1);
}

TEST_F(BebopControlTest, NotAcknowledged) {
  platform.SetSendResult(false);
  EXPECT_EQ(bebop.TakeOff(), ActionResult::NotAcknowledged);
  EXPECT_EQ(platform.GetSent().size(), 1u);
}

TEST(BebopControlLookupTest, MissingCommandIsLookupFailed) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  BebopControl bebop(platform, CommandTable{}, decoder);
  ASSERT_TRUE(bebop.Connect(1));

  EXPECT_EQ(bebop.TakeOff(), ActionResult::LookupFailed);
  EXPECT_EQ(bebop.FlyDirect(0, 0, 0, 0, 0.5), ActionResult::LookupFailed);
  EXPECT_EQ(bebop.Flip("front"), ActionResult::LookupFailed);
  EXPECT_TRUE(platform.GetSent().empty());
  EXPECT_TRUE(platform.HasLog(LogLevel::Error,
                              "Cannot resolve ardrone3/Piloting/TakeOff"));
}

// ═══════════════════════════════════════════════════════════════════════════
// FlyDirect
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(BebopControlTest, FlyDirectClampsEachAxis) {
  EXPECT_EQ(bebop.FlyDirect(-150, 150, 0, 40, 2.0), ActionResult::Sent);

  ASSERT_EQ(platform.GetSentPcmd().size(), 1u);
  EXPECT_EQ(platform.GetSentPcmd()[0], (PcmdCommand{-100, 100, 0, 40}));
  EXPECT_DOUBLE_EQ(platform.GetLastPcmdDuration(), 2.0);
  EXPECT_TRUE(platform.HasLog(
      LogLevel::Info, "roll is -100 pitch is 100 yaw is 0 vertical is 40"));
}

TEST_F(BebopControlTest, FlyDirectBoundaryValuesUnchanged) {
  EXPECT_EQ(bebop.FlyDirect(100, -100, 0, 0, 0.0), ActionResult::Sent);
  ASSERT_EQ(platform.GetSentPcmd().size(), 1u);
  EXPECT_EQ(platform.GetSentPcmd()[0], (PcmdCommand{100, -100, 0, 0}));
}

TEST(BebopControlConfigTest, FlyDirectUsesConfiguredLimit) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  ControllerConfig config;
  config.pcmd_limit = 50;
  BebopControl bebop(platform, CommandTable::Builtin(), decoder, config);
  ASSERT_TRUE(bebop.Connect(1));

  EXPECT_EQ(bebop.FlyDirect(80, -80, 10, 0, 1.0), ActionResult::Sent);
  ASSERT_EQ(platform.GetSentPcmd().size(), 1u);
  EXPECT_EQ(platform.GetSentPcmd()[0], (PcmdCommand{50, -50, 10, 0}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Flip
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(BebopControlTest, FlipIsCaseInsensitive) {
  EXPECT_EQ(bebop.Flip("Left"), ActionResult::Sent);

  ASSERT_EQ(platform.GetSentEnum().size(), 1u);
  const auto& [cmd, arg] = platform.GetSentEnum()[0];
  EXPECT_EQ(cmd, BuiltinDescriptor("ardrone3", "Animations", "Flip"));
  EXPECT_EQ(arg, (EnumSelector{3, 4}));
}

TEST_F(BebopControlTest, FlipInvalidDirectionSendsNothing) {
  EXPECT_EQ(bebop.Flip("UP"), ActionResult::InvalidArgument);

  EXPECT_TRUE(platform.GetSentEnum().empty());
  EXPECT_TRUE(platform.GetSent().empty());
  EXPECT_TRUE(platform.HasLog(LogLevel::Error, "UP is not a valid direction"));
}

TEST_F(BebopControlTest, FlipAllDirections) {
  for (const char* dir : {"front", "BACK", "Right", "left"}) {
    EXPECT_EQ(bebop.Flip(dir), ActionResult::Sent) << dir;
  }
  EXPECT_EQ(platform.GetSentEnum().size(), 4u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Telemetry Wiring
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(BebopControlTest, TelemetryReachesSensors) {
  decoder.Push({MakeFlyingStateEvent(FlyingState::Hovering),
                MakeEvent("BatteryStateChanged_percent", 73)});
  platform.DeliverPacket(true, 126, 1);

  EXPECT_EQ(bebop.Sensors().GetFlyingState(), FlyingState::Hovering);
  ExpectOptionalEq(bebop.Sensors().Get("BatteryStateChanged_percent"),
                   SensorValue(int64_t{73}));
  EXPECT_EQ(bebop.GetTelemetryStats().acks_sent, 1u);
}

TEST_F(BebopControlTest, SmartSleepDelegatesToPlatform) {
  platform.SetTimeMs(100);
  bebop.SmartSleep(250);
  EXPECT_EQ(platform.GetTimeMs(), 350u);
  EXPECT_EQ(platform.GetSleepCount(), 1);
}

TEST(BebopControlMockTest, SendsResolvedDescriptor) {
  NiceMock<MockPlatform> platform;
  FakeTelemetryDecoder decoder;
  EXPECT_CALL(platform, Connect(2)).WillOnce(Return(true));
  BebopControl bebop(platform, CommandTable::Builtin(), decoder);
  ASSERT_TRUE(bebop.Connect(2));

  EXPECT_CALL(platform, SendAckCommand(kLanding)).WillOnce(Return(true));
  EXPECT_CALL(platform, SendPcmd(_, _, _)).Times(0);
  EXPECT_EQ(bebop.Land(), ActionResult::Sent);
}
