/*
 * Telemetry Source Implementation
 */

#include "telemetry_source.h"

TelemetrySource::TelemetrySource()
  : actuator(nullptr)
  , channel(nullptr)
  , periodicKind(TELEM_NONE)
  , intervalMs(0)
  , nextMs(0)
  , started(false)
  , pushCount(0)
{
}

void TelemetrySource::init(Actuator* a, ReplyChannel* c) {
  actuator = a;
  channel = c;
}

void TelemetrySource::configure(TelemetryKind kind, uint32_t interval) {
  periodicKind = kind;
  intervalMs = interval;
  started = false;
}

uint32_t TelemetrySource::sample(TelemetryKind kind) {
  if (!actuator) {
    return 0;
  }
  switch (kind) {
    case TELEM_DIST:
      return actuator->readDistanceCm();
    case TELEM_TRK:
      return actuator->readLineSensors() & (LINE_SENSOR_RIGHT | LINE_SENSOR_LEFT);
    default:
      return 0;
  }
}

bool TelemetrySource::push(TelemetryKind kind) {
  if (kind != TELEM_DIST && kind != TELEM_TRK) {
    return false;
  }
  if (!channel) {
    return false;
  }
  pushCount++;
  return channel->send(ReplyEncoder::telemetry(kind, sample(kind)));
}

void TelemetrySource::update(uint32_t now) {
  if (periodicKind == TELEM_NONE || intervalMs == 0) {
    return;
  }

  if (!started) {
    nextMs = now;  // First push immediately
    started = true;
  }

  // Signed difference stays correct across millis() rollover
  if ((int32_t)(now - nextMs) >= 0) {
    nextMs = now + intervalMs;
    push(periodicKind);
  }
}
