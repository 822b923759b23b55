/*
 * Protocol Engine
 *
 * One instance per robot: binds a Profile, an Actuator and a Transport to
 * the receive / parse / dispatch / execute / reply pipeline.
 *
 *   transport -> LineReceiver -> CommandParser -> Dispatcher -> Executor
 *   Executor / TimerSupervisor / TelemetrySource -> ReplyChannel -> transport
 *
 * Everything is driven by explicit millisecond timestamps so the scheduler
 * (firmware) or a test decides when time passes.
 */

#ifndef PROTOCOL_ENGINE_H
#define PROTOCOL_ENGINE_H

#include <stdint.h>
#include "config.h"
#include "protocol/profile.h"
#include "hal/actuator.h"
#include "hal/transport.h"
#include "serial/line_receiver.h"
#include "engine_stats.h"
#include "reply_channel.h"
#include "telemetry_source.h"
#include "timer_supervisor.h"
#include "executor.h"
#include "dispatcher.h"

class ProtocolEngine {
public:
  ProtocolEngine();

  void init(Actuator* actuator, Transport* transport);

  // Switch profile. Drops partial frames, queued commands and any running
  // timed action, and clears the counters.
  void configure(const Profile& profile);

  // Startup telemetry (Profile C reports the line sensors once)
  void begin(uint32_t now);

  // Drain up to maxBytes from the transport (RX task)
  void pollTransport(uint32_t now, uint8_t maxBytes = RX_BYTES_PER_POLL);

  // Feed one byte; returns true if it completed a frame
  bool processByte(uint8_t byte, uint32_t now);

  // Handle one already-segmented frame (prefix and terminator stripped)
  void handleFrame(const char* frame, uint32_t now);

  // Scheduler ticks
  void pumpDispatcher(uint32_t now);
  void tickTimer(uint32_t now);
  void tickTelemetry(uint32_t now);

  // All of the above in one call (host loops and tests)
  void tick(uint32_t now);

  // Interval for the telemetry task, 0 when the profile pushes nothing
  uint32_t getTelemetryTaskMs() const;

  const Profile& getProfile() const { return profile; }
  const EngineStats& stats() const { return engineStats; }
  const Dispatcher& getDispatcher() const { return dispatcher; }
  const TimerSupervisor& getTimer() const { return timer; }
  const TelemetrySource& getTelemetry() const { return telemetry; }

private:
  Actuator* actuator;
  Transport* transport;
  Profile profile;

  EngineStats engineStats;
  LineReceiver receiver;
  ReplyChannel channel;
  TelemetrySource telemetry;
  TimerSupervisor timer;
  Executor executor;
  Dispatcher dispatcher;

  bool initialized;
};

#endif // PROTOCOL_ENGINE_H
