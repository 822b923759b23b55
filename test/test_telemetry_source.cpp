#include <gtest/gtest.h>
#include "fakes.h"
#include "engine/telemetry_source.h"

class TelemetrySourceTest : public ::testing::Test {
protected:
  void SetUp() {
    engineStatsReset(stats);
    channel.init(&transport, &stats);
    channel.configure(REPLY_STYLE_VERBOSE);
    telemetry.init(&actuator, &channel);
  }

  FakeActuator actuator;
  FakeTransport transport;
  EngineStats stats;
  ReplyChannel channel;
  TelemetrySource telemetry;
};

TEST_F(TelemetrySourceTest, PeriodicDistanceOnInterval) {
  actuator.distanceCm = 37;
  telemetry.configure(TELEM_DIST, 500);

  telemetry.update(0);
  telemetry.update(100);
  telemetry.update(499);
  telemetry.update(500);
  telemetry.update(999);
  telemetry.update(1000);

  ASSERT_EQ(3u, transport.lines.size());
  EXPECT_EQ("#DIST,37\n", transport.lines[0]);
  EXPECT_EQ(3, telemetry.getPushCount());
}

TEST_F(TelemetrySourceTest, DisabledWithoutKindOrInterval) {
  telemetry.configure(TELEM_NONE, 500);
  telemetry.update(0);
  telemetry.update(1000);
  telemetry.configure(TELEM_DIST, 0);
  telemetry.update(2000);
  EXPECT_TRUE(transport.lines.empty());
}

TEST_F(TelemetrySourceTest, PushOnlyForSensorKinds) {
  actuator.lineMask = LINE_SENSOR_RIGHT;
  EXPECT_TRUE(telemetry.push(TELEM_TRK));
  EXPECT_FALSE(telemetry.push(TELEM_LED));
  EXPECT_FALSE(telemetry.push(TELEM_NONE));
  ASSERT_EQ(1u, transport.lines.size());
  EXPECT_EQ("#TRK,1\n", transport.lines[0]);
}

TEST_F(TelemetrySourceTest, TrackingMaskIsTwoBits) {
  actuator.lineMask = 0xFF;
  EXPECT_EQ(3u, telemetry.sample(TELEM_TRK));
}

TEST_F(TelemetrySourceTest, DroppedLineCountsInStats) {
  transport.refuse = true;
  EXPECT_FALSE(telemetry.push(TELEM_DIST));
  EXPECT_EQ(1, stats.tx_dropped);
}
