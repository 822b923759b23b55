/*
 * Timer Supervisor Implementation
 */

#include "timer_supervisor.h"
#include "core/log.h"

TimerSupervisor::TimerSupervisor()
  : telemetry(nullptr)
  , expiryTelemetry(TELEM_NONE)
  , expiryCount(0)
{
  state.active = false;
  state.startTimestamp = 0;
  state.endTimestamp = 0;
  state.onExpire = nullptr;
  state.context = nullptr;
}

void TimerSupervisor::init(TelemetrySource* t) {
  telemetry = t;
  cancel();
}

void TimerSupervisor::start(uint32_t now, uint32_t durationMs, StopAction onExpire, void* context) {
  state.startTimestamp = now;
  state.endTimestamp = now + durationMs;
  state.onExpire = onExpire;
  state.context = context;
  state.active = true;
  LOG_V("TMR", "armed %lu ms", (unsigned long)durationMs);
}

void TimerSupervisor::cancel() {
  state.active = false;
  state.onExpire = nullptr;
  state.context = nullptr;
}

bool TimerSupervisor::update(uint32_t now) {
  if (!state.active) {
    return false;
  }

  // Wrap-safe "now >= end"
  if ((int32_t)(now - state.endTimestamp) < 0) {
    return false;
  }

  // Clear first: the stop action may re-enter cancel()
  StopAction action = state.onExpire;
  void* context = state.context;
  state.active = false;
  state.onExpire = nullptr;
  state.context = nullptr;
  expiryCount++;

  if (action) {
    action(context);
  }
  if (telemetry && expiryTelemetry != TELEM_NONE) {
    telemetry->push(expiryTelemetry);
  }

  LOG_V("TMR", "expired, overrun %lu ms", (unsigned long)(now - state.endTimestamp));
  return true;
}
