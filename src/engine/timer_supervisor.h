/*
 * Timer Supervisor
 *
 * Enforces the duration of the one timed action (GO) by polling, so the
 * command path never blocks. update() is called from a fixed tick; the
 * commanded duration may overrun by up to one tick interval.
 */

#ifndef TIMER_SUPERVISOR_H
#define TIMER_SUPERVISOR_H

#include <stdint.h>
#include "protocol/protocol_types.h"
#include "telemetry_source.h"

// Invoked once when the timed action expires
typedef void (*StopAction)(void* context);

struct TimerState {
  bool active;
  uint32_t startTimestamp;
  uint32_t endTimestamp;
  StopAction onExpire;
  void* context;
};

class TimerSupervisor {
public:
  TimerSupervisor();

  void init(TelemetrySource* telemetry);

  // Completion telemetry pushed after the stop action (TELEM_NONE = silent)
  void setExpiryTelemetry(TelemetryKind kind) { expiryTelemetry = kind; }

  // Arm the timer. Replaces any action already in flight.
  void start(uint32_t now, uint32_t durationMs, StopAction onExpire, void* context);

  // Clear without firing (SP, superseding motion)
  void cancel();

  // Fire the stop action if due. Returns true on the tick that expired.
  bool update(uint32_t now);

  bool isActive() const { return state.active; }
  uint32_t getEndTime() const { return state.endTimestamp; }
  uint16_t getExpiryCount() const { return expiryCount; }

private:
  TelemetrySource* telemetry;
  TelemetryKind expiryTelemetry;
  TimerState state;
  uint16_t expiryCount;
};

#endif // TIMER_SUPERVISOR_H
