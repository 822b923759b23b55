/*
 * Protocol Engine Implementation
 */

#include "protocol_engine.h"
#include "protocol/command_parser.h"
#include "protocol/reply_encoder.h"
#include "core/log.h"

ProtocolEngine::ProtocolEngine()
  : actuator(nullptr)
  , transport(nullptr)
  , profile(profileA())
  , initialized(false)
{
  engineStatsReset(engineStats);
}

void ProtocolEngine::init(Actuator* a, Transport* t) {
  actuator = a;
  transport = t;

  channel.init(transport, &engineStats);
  telemetry.init(actuator, &channel);
  timer.init(&telemetry);
  executor.init(actuator, &timer, &telemetry, &channel, &engineStats);
  dispatcher.init(&executor, &channel, &engineStats);

  initialized = true;
  configure(profile);
}

void ProtocolEngine::configure(const Profile& p) {
  profile = p;

  // A profile switch must not leave the robot moving under the old rules
  if (initialized) {
    executor.hardStop();
  }
  timer.cancel();

  receiver.configure(profile.delimiter);
  channel.configure(profile.replies);
  telemetry.configure(profile.periodicTelemetry, profile.telemetryIntervalMs);
  timer.setExpiryTelemetry(profile.expiryTelemetry);
  executor.configure(profile);
  dispatcher.configure(profile);

  engineStatsReset(engineStats);

  LOG_I("ENG", "profile %c (cap %u, %s)", profile.name, (unsigned)dispatcher.getCapacity(),
        profile.dispatch == DISPATCH_QUEUED ? "queued" : "immediate");
}

void ProtocolEngine::begin(uint32_t now) {
  (void)now;
  if (profile.startupTelemetry && profile.motionTelemetry != TELEM_NONE) {
    telemetry.push(profile.motionTelemetry);
  }
}

void ProtocolEngine::pollTransport(uint32_t now, uint8_t maxBytes) {
  if (!transport) {
    return;
  }

  uint8_t processed = 0;
  while (processed < maxBytes && transport->available() > 0) {
    int c = transport->read();
    if (c < 0) {
      break;
    }
    processed++;
    processByte((uint8_t)c, now);
  }
}

bool ProtocolEngine::processByte(uint8_t byte, uint32_t now) {
  uint16_t droppedBefore = receiver.getDroppedLong();
  bool ready = receiver.processByte(byte);
  if (receiver.getDroppedLong() != droppedBefore) {
    engineStats.frames_dropped_long++;
  }

  if (!ready) {
    return false;
  }
  handleFrame(receiver.frame(), now);
  return true;
}

void ProtocolEngine::handleFrame(const char* frame, uint32_t now) {
  if (!frame || frame[0] == '\0') {
    return;
  }
  engineStats.frames_received++;

  if (channel.getEncoder().getStyle() == REPLY_STYLE_ECHO) {
    channel.send(ReplyEncoder::echo(frame));
  }

  Command cmd;
  if (!CommandParser::parse(frame, cmd)) {
    engineStats.parse_errors++;
    LOG_V("ENG", "parse failed: %s", frame);
    channel.send(ReplyEncoder::error(0, ERR_PARSE_FAIL));
    return;
  }

  engineStats.last_cmd_ms = now;
  dispatcher.submit(cmd, now);
  dispatcher.pump(now);
}

void ProtocolEngine::pumpDispatcher(uint32_t now) {
  dispatcher.pump(now);
}

void ProtocolEngine::tickTimer(uint32_t now) {
  timer.update(now);
}

void ProtocolEngine::tickTelemetry(uint32_t now) {
  telemetry.update(now);
}

uint32_t ProtocolEngine::getTelemetryTaskMs() const {
  if (profile.periodicTelemetry == TELEM_NONE) {
    return 0;
  }
  return profile.telemetryIntervalMs;
}

void ProtocolEngine::tick(uint32_t now) {
  pollTransport(now);
  tickTimer(now);
  pumpDispatcher(now);
  tickTelemetry(now);
}
