#include <gtest/gtest.h>
#include "fakes.h"
#include "engine/timer_supervisor.h"

static int g_stopCount = 0;

static void countStop(void* context) {
  int* counter = static_cast<int*>(context);
  (*counter)++;
}

static void cancellingStop(void* context) {
  TimerSupervisor* timer = static_cast<TimerSupervisor*>(context);
  timer->cancel();
  g_stopCount++;
}

class TimerSupervisorTest : public ::testing::Test {
protected:
  void SetUp() {
    engineStatsReset(stats);
    channel.init(&transport, &stats);
    channel.configure(REPLY_STYLE_TELEMETRY_ONLY);
    telemetry.init(&actuator, &channel);
    timer.init(&telemetry);
    stops = 0;
  }

  FakeActuator actuator;
  FakeTransport transport;
  EngineStats stats;
  ReplyChannel channel;
  TelemetrySource telemetry;
  TimerSupervisor timer;
  int stops;
};

TEST_F(TimerSupervisorTest, FiresOnceAtDeadline) {
  timer.start(1000, 255, countStop, &stops);
  EXPECT_FALSE(timer.update(1100));
  EXPECT_FALSE(timer.update(1254));
  EXPECT_TRUE(timer.update(1255));
  EXPECT_EQ(1, stops);
  EXPECT_FALSE(timer.isActive());
  EXPECT_FALSE(timer.update(1400));
  EXPECT_EQ(1, stops);
  EXPECT_EQ(1, timer.getExpiryCount());
}

TEST_F(TimerSupervisorTest, StopsWithinOneTickOfDuration) {
  // 100 ms ticks starting at arm time
  timer.start(0, 255, countStop, &stops);
  uint32_t firedAt = 0;
  for (uint32_t now = 0; now <= 1000; now += TIMER_TICK_MS) {
    if (timer.update(now)) {
      firedAt = now;
      break;
    }
  }
  EXPECT_GE(firedAt, 255u);
  EXPECT_LE(firedAt, 255u + TIMER_TICK_MS);
}

TEST_F(TimerSupervisorTest, CancelPreventsExpiryAndTelemetry) {
  timer.setExpiryTelemetry(TELEM_TRK);
  timer.start(0, 100, countStop, &stops);
  timer.cancel();
  EXPECT_FALSE(timer.update(500));
  EXPECT_EQ(0, stops);
  EXPECT_TRUE(transport.lines.empty());
}

TEST_F(TimerSupervisorTest, ExpiryTelemetryFollowsStop) {
  timer.setExpiryTelemetry(TELEM_TRK);
  actuator.lineMask = LINE_SENSOR_RIGHT | LINE_SENSOR_LEFT;
  timer.start(0, 50, countStop, &stops);
  EXPECT_TRUE(timer.update(100));
  ASSERT_EQ(1u, transport.lines.size());
  EXPECT_EQ("#TRK,3\n", transport.lines[0]);
}

TEST_F(TimerSupervisorTest, RestartReplacesPendingAction) {
  timer.start(0, 100, countStop, &stops);
  timer.start(50, 300, countStop, &stops);
  EXPECT_FALSE(timer.update(200));
  EXPECT_TRUE(timer.update(350));
  EXPECT_EQ(1, stops);
}

TEST_F(TimerSupervisorTest, DeadlineAcrossMillisRollover) {
  timer.start(0xFFFFFF00UL, 0x200, countStop, &stops);
  EXPECT_FALSE(timer.update(0xFFFFFFF0UL));
  EXPECT_FALSE(timer.update(0x000000FFUL));
  EXPECT_TRUE(timer.update(0x00000100UL));
}

TEST_F(TimerSupervisorTest, StopActionMayCancelReentrantly) {
  g_stopCount = 0;
  timer.start(0, 10, cancellingStop, &timer);
  EXPECT_TRUE(timer.update(10));
  EXPECT_EQ(1, g_stopCount);
  EXPECT_FALSE(timer.isActive());
}
