#include <gtest/gtest.h>
#include "fakes.h"
#include "engine/executor.h"
#include "protocol/command_parser.h"

class ExecutorTest : public ::testing::Test {
protected:
  void SetUp() {
    engineStatsReset(stats);
    channel.init(&transport, &stats);
    telemetry.init(&actuator, &channel);
    timer.init(&telemetry);
    executor.init(&actuator, &timer, &telemetry, &channel, &stats);
    useProfile(profileA());
  }

  void useProfile(const Profile& p) {
    channel.configure(p.replies);
    timer.setExpiryTelemetry(p.expiryTelemetry);
    executor.configure(p);
  }

  ExecResult run(const char* frame, uint32_t now = 0) {
    Command cmd;
    EXPECT_TRUE(CommandParser::parse(frame, cmd));
    return executor.execute(cmd, now);
  }

  FakeActuator actuator;
  FakeTransport transport;
  EngineStats stats;
  ReplyChannel channel;
  TelemetrySource telemetry;
  TimerSupervisor timer;
  Executor executor;
};

TEST_F(ExecutorTest, InstantForwardSetsBothMotors) {
  ExecResult r = run("05,MV,32,32");
  EXPECT_EQ(ERR_NONE, r.error);
  EXPECT_EQ(50, actuator.left);
  EXPECT_EQ(50, actuator.right);
}

TEST_F(ExecutorTest, SpeedIsClampedToHundred) {
  run("01,MV,FF");
  EXPECT_EQ(100, actuator.left);
  EXPECT_EQ(100, actuator.right);
}

TEST_F(ExecutorTest, BackwardDefaultsToHalfSpeed) {
  run("01,BK,00");
  EXPECT_EQ(-50, actuator.left);
  EXPECT_EQ(-50, actuator.right);

  run("02,BK,14");
  EXPECT_EQ(-20, actuator.left);
}

TEST_F(ExecutorTest, InstantTurns) {
  run("01,TL,20");
  run("02,TR,20");
  EXPECT_EQ(1, actuator.turnLeftCalls);
  EXPECT_EQ(1, actuator.turnRightCalls);
  EXPECT_EQ(0, actuator.timedCalls);
}

TEST_F(ExecutorTest, TimedMotionInMilliseconds) {
  useProfile(profileC());
  run("01,MV,32,FA");
  EXPECT_EQ(1, actuator.timedCalls);
  EXPECT_EQ(MOVE_FORWARD, actuator.lastDirection);
  EXPECT_EQ(50, actuator.lastTimedSpeed);
  EXPECT_FLOAT_EQ(0.25f, actuator.lastTimedSeconds);
}

TEST_F(ExecutorTest, TimedMotionInLegacySeconds) {
  useProfile(profileB());
  run("01,TR,64,02");
  EXPECT_EQ(MOVE_RIGHT, actuator.lastDirection);
  EXPECT_EQ(100, actuator.lastTimedSpeed);
  EXPECT_FLOAT_EQ(2.0f, actuator.lastTimedSeconds);
}

TEST_F(ExecutorTest, MotionTelemetryInTrackingProfile) {
  useProfile(profileC());
  actuator.lineMask = LINE_SENSOR_LEFT;
  run("01,BK,32,10");
  ASSERT_EQ(1u, transport.lines.size());
  EXPECT_EQ("#TRK,2\n", transport.lines[0]);

  run("02,SP");
  ASSERT_EQ(2u, transport.lines.size());
  EXPECT_EQ("#TRK,2\n", transport.lines[1]);
}

TEST_F(ExecutorTest, GoStartsMotorsAndArmsTimer) {
  ExecResult r = run("07,GO,64,FF", 1000);
  EXPECT_EQ(ERR_NONE, r.error);
  EXPECT_EQ(100, actuator.left);
  EXPECT_EQ(100, actuator.right);
  EXPECT_TRUE(timer.isActive());
  EXPECT_EQ(1255u, timer.getEndTime());
}

TEST_F(ExecutorTest, GoWithZeroArgsIsRejectedWithHardStop) {
  actuator.left = 30;
  ExecResult r = run("01,GO,00,10");
  EXPECT_EQ(ERR_GO_INVALID_ARGS, r.error);
  EXPECT_EQ(0, actuator.left);
  EXPECT_EQ(1, actuator.stopCalls);
  EXPECT_FALSE(timer.isActive());

  r = run("02,GO,10,00");
  EXPECT_EQ(ERR_GO_INVALID_ARGS, r.error);
  EXPECT_EQ(2, actuator.stopCalls);
  EXPECT_FALSE(timer.isActive());
}

TEST_F(ExecutorTest, StopCancelsActiveGo) {
  run("01,GO,32,FF", 0);
  ASSERT_TRUE(timer.isActive());
  run("02,SP", 10);
  EXPECT_FALSE(timer.isActive());
  EXPECT_EQ(0, actuator.left);
  EXPECT_FALSE(timer.update(1000));
}

TEST_F(ExecutorTest, NewMotionSupersedesGo) {
  run("01,GO,32,FF", 0);
  run("02,MV,14", 10);
  EXPECT_FALSE(timer.isActive());
  EXPECT_EQ(20, actuator.left);
}

TEST_F(ExecutorTest, FailedStopIsCountedAndIgnored) {
  actuator.stopResult = false;
  ExecResult r = run("01,SP");
  EXPECT_EQ(ERR_NONE, r.error);
  EXPECT_EQ(1, stats.stop_failures);
}

TEST_F(ExecutorTest, LightsResolveColor) {
  run("01,HL,01");
  EXPECT_EQ(0xFFFFFFu, actuator.lightColor);
  EXPECT_EQ("#LED,FFFFFF\n", transport.last());

  run("02,HL,00");
  EXPECT_EQ(0u, actuator.lightColor);

  run("03,HL,FF,80,00");
  EXPECT_EQ(0xFF8000u, actuator.lightColor);
  EXPECT_EQ("#LED,FF8000\n", transport.last());
}

TEST_F(ExecutorTest, LightTelemetryOffInTrackingProfile) {
  useProfile(profileC());
  run("01,HL,01");
  EXPECT_EQ(1, actuator.lightCalls);
  EXPECT_TRUE(transport.lines.empty());
}

TEST_F(ExecutorTest, BackgroundToneHoldsForDuration) {
  ExecResult r = run("01,BZ,01,B8,0A");
  EXPECT_EQ(440, actuator.lastToneFreq);
  EXPECT_EQ(100, actuator.lastToneDuration);
  EXPECT_EQ(100u, r.holdMs);
  EXPECT_EQ(TELEM_BUZ_DONE, r.completionTelemetry);
  EXPECT_TRUE(transport.lines.empty());
}

TEST_F(ExecutorTest, BlockingToneReportsImmediately) {
  useProfile(profileB());
  ExecResult r = run("01,BZ,00,10,00");
  EXPECT_EQ(100, actuator.lastToneFreq);   // 0x10 clamped up
  EXPECT_EQ(100, actuator.lastToneDuration);  // 0 -> default
  EXPECT_EQ(0u, r.holdMs);
  EXPECT_EQ("#BUZ,done\n", transport.last());
}

TEST_F(ExecutorTest, ToneResolution) {
  EXPECT_EQ(5000, Executor::resolveToneFrequency(0xFF, 0xFF));
  EXPECT_EQ(100, Executor::resolveToneFrequency(0, 0));
  EXPECT_EQ(1000, Executor::resolveToneFrequency(0x03, 0xE8));
  EXPECT_EQ(2550, Executor::resolveToneDuration(0xFF));
  EXPECT_EQ(100, Executor::resolveToneDuration(0));
}

TEST_F(ExecutorTest, EchoIsNoOp) {
  ExecResult r = run("01,EC");
  EXPECT_EQ(ERR_NONE, r.error);
  EXPECT_TRUE(actuator.calls.empty());
}

TEST_F(ExecutorTest, UnknownOpcode) {
  ExecResult r = run("00,ZZ,00,00");
  EXPECT_EQ(ERR_UNKNOWN_OP, r.error);
  EXPECT_EQ(1, stats.unknown_opcodes);
  EXPECT_TRUE(actuator.calls.empty());
}
