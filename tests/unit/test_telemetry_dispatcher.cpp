#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock_platform.hpp"
#include "telemetry_dispatcher.hpp"
#include "test_helpers.hpp"

using namespace bebop;
using namespace bebop::testing;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;

namespace {

TelemetryPacket MakePacket(bool ack_required, uint8_t buffer_id = 126,
                           uint8_t seq = 7) {
  TelemetryPacket packet;
  packet.data_type = ack_required ? 4 : 2;
  packet.buffer_id = buffer_id;
  packet.sequence_number = seq;
  packet.ack_required = ack_required;
  return packet;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Event Application
// ═══════════════════════════════════════════════════════════════════════════

TEST(TelemetryDispatcherTest, AppliesEventsInOrder) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  SensorStateStore store;
  TelemetryDispatcher dispatcher(platform, decoder, store);

  decoder.Push({MakeEvent("BatteryStateChanged_percent", 80),
                MakeEvent("BatteryStateChanged_percent", 79)});
  dispatcher.OnTelemetryPacket(MakePacket(false));

  ExpectOptionalEq(store.Get("BatteryStateChanged_percent"),
                   SensorValue(int64_t{79}));
  EXPECT_EQ(dispatcher.GetStats().events_applied, 2u);
}

TEST(TelemetryDispatcherTest, ResolvesEnumsWithDecoderTable) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  SensorStateStore store;
  TelemetryDispatcher dispatcher(platform, decoder, store);

  decoder.Push({MakeFlyingStateEvent(FlyingState::TakingOff)});
  dispatcher.OnTelemetryPacket(MakePacket(true));

  ExpectEnumLabel(store.Get(FLYING_STATE_FIELD), "takingoff");
  EXPECT_EQ(store.GetFlyingState(), FlyingState::TakingOff);
}

// ═══════════════════════════════════════════════════════════════════════════
// Acknowledgement
// ═══════════════════════════════════════════════════════════════════════════

TEST(TelemetryDispatcherTest, AcksOncePerPacket) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  SensorStateStore store;
  TelemetryDispatcher dispatcher(platform, decoder, store);

  decoder.Push({MakeFlyingStateEvent(FlyingState::Hovering),
                MakeEvent("BatteryStateChanged_percent", 64)});
  dispatcher.OnTelemetryPacket(MakePacket(true, 126, 42));

  ASSERT_EQ(platform.GetAcks().size(), 1u)
      << "Two events in one packet must produce exactly one ACK";
  EXPECT_EQ(platform.GetAcks()[0], (std::pair<uint8_t, uint8_t>{126, 42}));
  EXPECT_EQ(store.Size(), 2u);
}

TEST(TelemetryDispatcherTest, NoAckWhenNotRequired) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  SensorStateStore store;
  TelemetryDispatcher dispatcher(platform, decoder, store);

  decoder.Push({MakeEvent("BatteryStateChanged_percent", 64)});
  dispatcher.OnTelemetryPacket(MakePacket(false));

  EXPECT_TRUE(platform.GetAcks().empty());
  EXPECT_EQ(dispatcher.GetStats().acks_sent, 0u);
}

TEST(TelemetryDispatcherTest, AcksEmptyPacket) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  SensorStateStore store;
  TelemetryDispatcher dispatcher(platform, decoder, store);

  dispatcher.OnTelemetryPacket(MakePacket(true));

  EXPECT_EQ(platform.GetAcks().size(), 1u);
  EXPECT_EQ(store.Size(), 0u);
}

TEST(TelemetryDispatcherTest, AckAfterStoreUpdate) {
  NiceMock<MockPlatform> platform;
  FakeTelemetryDecoder decoder;
  SensorStateStore store;
  TelemetryDispatcher dispatcher(platform, decoder, store);

  decoder.Push({MakeFlyingStateEvent(FlyingState::Landing)});

  // К моменту ACK состояние уже записано
  EXPECT_CALL(platform, AckPacket(126, 7))
      .WillOnce(Invoke([&](uint8_t, uint8_t) {
        EXPECT_EQ(store.GetFlyingState(), FlyingState::Landing);
      }));
  dispatcher.OnTelemetryPacket(MakePacket(true));
}

// ═══════════════════════════════════════════════════════════════════════════
// Unnamed Events
// ═══════════════════════════════════════════════════════════════════════════

TEST(TelemetryDispatcherTest, UnnamedEventDoesNotStopPacket) {
  FakePlatform platform;
  FakeTelemetryDecoder decoder;
  SensorStateStore store;
  TelemetryDispatcher dispatcher(platform, decoder, store);

  decoder.Push(
      {MakeUnnamedEvent(), MakeEvent("BatteryStateChanged_percent", 55)});
  dispatcher.OnTelemetryPacket(MakePacket(true, 126, 3));

  ExpectOptionalEq(store.Get("BatteryStateChanged_percent"),
                   SensorValue(int64_t{55}));
  EXPECT_EQ(platform.GetAcks().size(), 1u);

  const auto stats = dispatcher.GetStats();
  EXPECT_EQ(stats.events_missing_name, 1u);
  EXPECT_EQ(stats.events_applied, 1u);
  EXPECT_EQ(stats.packets, 1u);
}

TEST(TelemetryDispatcherTest, UnnamedEventLogsPacketHeader) {
  NiceMock<MockPlatform> platform;
  FakeTelemetryDecoder decoder;
  SensorStateStore store;
  TelemetryDispatcher dispatcher(platform, decoder, store);

  decoder.Push({MakeUnnamedEvent()});

  EXPECT_CALL(platform,
              Log(LogLevel::Warning,
                  HasSubstr("data type 2 buffer id 127 sequence number 9")))
      .Times(1);
  EXPECT_CALL(platform, Log(LogLevel::Warning, HasSubstr("sensor is missing")))
      .Times(1);
  dispatcher.OnTelemetryPacket(MakePacket(false, 127, 9));
}
