/*
 * Command Executor
 *
 * Maps an opcode to Actuator calls. Args are clamped before they reach the
 * hardware. GO returns immediately and leaves the stop to the
 * TimerSupervisor; everything else is instantaneous or a blocking platform
 * call that returns once the physical action is done.
 */

#ifndef EXECUTOR_H
#define EXECUTOR_H

#include <stdint.h>
#include "protocol/protocol_types.h"
#include "protocol/profile.h"
#include "hal/actuator.h"
#include "engine_stats.h"
#include "reply_channel.h"
#include "telemetry_source.h"
#include "timer_supervisor.h"

struct ExecResult {
  ErrorCode error;                    // ERR_NONE = success
  uint32_t holdMs;                    // Keep the dispatcher busy this long
  TelemetryKind completionTelemetry;  // Sent when the hold ends
};

class Executor {
public:
  Executor();

  void init(Actuator* actuator, TimerSupervisor* timer, TelemetrySource* telemetry,
            ReplyChannel* channel, EngineStats* stats);
  void configure(const Profile& profile);

  ExecResult execute(const Command& cmd, uint32_t now);

  // Stop motors and drop any timed action. Fail-soft: a stop the hardware
  // does not confirm is counted and otherwise ignored.
  void hardStop();

  // Resolved HL color: RGB if arg2/arg3 set, else white/off from arg1
  static uint32_t resolveLightColor(uint8_t arg1, uint8_t arg2, uint8_t arg3);

  // BZ frequency ((arg1<<8)|arg2, clamped) and duration (arg3*10 ms, 0 → 100)
  static uint16_t resolveToneFrequency(uint8_t arg1, uint8_t arg2);
  static uint16_t resolveToneDuration(uint8_t arg3);

  static uint8_t clampSpeed(uint8_t raw);

private:
  Actuator* actuator;
  TimerSupervisor* timer;
  TelemetrySource* telemetry;
  ReplyChannel* channel;
  EngineStats* stats;

  MotionStyle motionStyle;
  DurationUnit durationUnit;
  ToneMode toneMode;
  TelemetryKind motionTelemetry;
  bool lightTelemetry;
  bool toneTelemetry;

  // Opcode handlers
  void handleMove(MoveDirection direction, uint8_t speed, uint8_t duration);
  void handleStop();
  ErrorCode handleGo(const Command& cmd, uint32_t now);
  void handleLights(const Command& cmd);
  void handleBuzzer(const Command& cmd, ExecResult& result);

  void stopMotors();
  float durationSeconds(uint8_t raw) const;
  void sendMotionTelemetry();

  // StopAction trampoline for the timer
  static void onTimerExpired(void* context);
};

#endif // EXECUTOR_H
