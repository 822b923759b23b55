/*
 * Telemetry Source
 *
 * Samples a sensor and pushes a telemetry line, either on its own fixed
 * interval or on demand (motion completion, GO expiry, startup).
 * Never waits on command execution.
 */

#ifndef TELEMETRY_SOURCE_H
#define TELEMETRY_SOURCE_H

#include <stdint.h>
#include "protocol/protocol_types.h"
#include "hal/actuator.h"
#include "reply_channel.h"

class TelemetrySource {
public:
  TelemetrySource();

  void init(Actuator* actuator, ReplyChannel* channel);

  // Periodic kind and interval (TELEM_NONE or 0 disables periodic pushes)
  void configure(TelemetryKind kind, uint32_t intervalMs);

  // Sample and send one frame of the given kind now.
  // Returns false for kinds that carry no sensor value.
  bool push(TelemetryKind kind);

  // Sensor value for a kind (cm for DIST, bitmask for TRK)
  uint32_t sample(TelemetryKind kind);

  // Call at any cadence; pushes when the interval has elapsed
  void update(uint32_t now);

  uint16_t getPushCount() const { return pushCount; }

private:
  Actuator* actuator;
  ReplyChannel* channel;

  TelemetryKind periodicKind;
  uint32_t intervalMs;
  uint32_t nextMs;
  bool started;

  uint16_t pushCount;
};

#endif // TELEMETRY_SOURCE_H
