/*
 * Command Executor Implementation
 */

#include "executor.h"
#include "protocol/hex_codec.h"
#include "core/log.h"

Executor::Executor()
  : actuator(nullptr)
  , timer(nullptr)
  , telemetry(nullptr)
  , channel(nullptr)
  , stats(nullptr)
  , motionStyle(MOTION_INSTANT)
  , durationUnit(DURATION_MILLISECONDS)
  , toneMode(TONE_BLOCKING)
  , motionTelemetry(TELEM_NONE)
  , lightTelemetry(false)
  , toneTelemetry(false)
{
}

void Executor::init(Actuator* a, TimerSupervisor* t, TelemetrySource* tel,
                    ReplyChannel* c, EngineStats* s) {
  actuator = a;
  timer = t;
  telemetry = tel;
  channel = c;
  stats = s;
}

void Executor::configure(const Profile& profile) {
  motionStyle = profile.motion;
  durationUnit = profile.durationUnit;
  toneMode = profile.tone;
  motionTelemetry = profile.motionTelemetry;
  lightTelemetry = profile.lightTelemetry;
  toneTelemetry = profile.toneTelemetry;
}

uint8_t Executor::clampSpeed(uint8_t raw) {
  return (uint8_t)clampInt(raw, SPEED_MIN, SPEED_MAX);
}

uint32_t Executor::resolveLightColor(uint8_t arg1, uint8_t arg2, uint8_t arg3) {
  if (arg2 > 0 || arg3 > 0) {
    return ((uint32_t)arg1 << 16) | ((uint32_t)arg2 << 8) | arg3;
  }
  return arg1 ? 0xFFFFFFUL : 0x000000UL;
}

uint16_t Executor::resolveToneFrequency(uint8_t arg1, uint8_t arg2) {
  int32_t freq = ((int32_t)arg1 << 8) | arg2;
  return (uint16_t)clampInt(freq, TONE_FREQ_MIN_HZ, TONE_FREQ_MAX_HZ);
}

uint16_t Executor::resolveToneDuration(uint8_t arg3) {
  uint16_t duration = (uint16_t)arg3 * TONE_DURATION_UNIT_MS;
  return duration == 0 ? TONE_DURATION_DEFAULT_MS : duration;
}

float Executor::durationSeconds(uint8_t raw) const {
  if (durationUnit == DURATION_SECONDS) {
    return (float)raw;
  }
  return raw / 1000.0f;
}

ExecResult Executor::execute(const Command& cmd, uint32_t now) {
  ExecResult result;
  result.error = ERR_NONE;
  result.holdMs = 0;
  result.completionTelemetry = TELEM_NONE;

  if (!actuator) {
    return result;
  }

  switch (cmd.opcode) {
    case OP_MV:
      handleMove(MOVE_FORWARD, clampSpeed(cmd.arg1), cmd.arg2);
      break;

    case OP_BK: {
      // Zero speed means "default reverse", not "stand still"
      uint8_t speed = cmd.arg1 > 0 ? clampSpeed(cmd.arg1) : SPEED_BACKWARD_DEFAULT;
      handleMove(MOVE_BACKWARD, speed, cmd.arg2);
      break;
    }

    case OP_TL:
      handleMove(MOVE_LEFT, clampSpeed(cmd.arg1), cmd.arg2);
      break;

    case OP_TR:
      handleMove(MOVE_RIGHT, clampSpeed(cmd.arg1), cmd.arg2);
      break;

    case OP_SP:
      handleStop();
      break;

    case OP_GO:
      result.error = handleGo(cmd, now);
      break;

    case OP_HL:
      handleLights(cmd);
      break;

    case OP_BZ:
      handleBuzzer(cmd, result);
      break;

    case OP_EC:
      break;

    default:
      if (stats) {
        stats->unknown_opcodes++;
      }
      LOG_V("EXEC", "unknown opcode %s", cmd.opText);
      result.error = ERR_UNKNOWN_OP;
      break;
  }

  return result;
}

void Executor::handleMove(MoveDirection direction, uint8_t speed, uint8_t duration) {
  // A new motion supersedes a running GO. An active timer always belongs to
  // the motion in progress, so the old deadline must not stop this one.
  if (timer) {
    timer->cancel();
  }

  if (motionStyle == MOTION_TIMED) {
    actuator->moveTimed(direction, speed, durationSeconds(duration));
  } else {
    int16_t s = speed;
    switch (direction) {
      case MOVE_FORWARD:
        actuator->setMotors(s, s);
        break;
      case MOVE_BACKWARD:
        actuator->setMotors(-s, -s);
        break;
      case MOVE_LEFT:
        actuator->turnLeft();
        break;
      case MOVE_RIGHT:
        actuator->turnRight();
        break;
    }
  }

  sendMotionTelemetry();
}

void Executor::handleStop() {
  hardStop();
  sendMotionTelemetry();
}

void Executor::hardStop() {
  if (timer) {
    timer->cancel();
  }
  stopMotors();
}

void Executor::stopMotors() {
  if (!actuator) {
    return;
  }
  actuator->setMotors(0, 0);
  if (!actuator->stop()) {
    if (stats) {
      stats->stop_failures++;
    }
    LOG_W("EXEC", "stop not confirmed, continuing");
  }
}

ErrorCode Executor::handleGo(const Command& cmd, uint32_t now) {
  if (cmd.arg1 == 0 || cmd.arg2 == 0) {
    hardStop();
    return ERR_GO_INVALID_ARGS;
  }

  int16_t speed = clampSpeed(cmd.arg1);
  actuator->setMotors(speed, speed);
  if (timer) {
    timer->start(now, cmd.arg2, onTimerExpired, this);  // arg2 always in ms
  }
  return ERR_NONE;
}

void Executor::onTimerExpired(void* context) {
  Executor* self = static_cast<Executor*>(context);
  if (self) {
    self->stopMotors();
  }
}

void Executor::handleLights(const Command& cmd) {
  uint32_t color = resolveLightColor(cmd.arg1, cmd.arg2, cmd.arg3);
  actuator->setLightColor(color);

  if (lightTelemetry && channel) {
    channel->send(ReplyEncoder::telemetry(TELEM_LED, color));
  }
}

void Executor::handleBuzzer(const Command& cmd, ExecResult& result) {
  uint16_t freq = resolveToneFrequency(cmd.arg1, cmd.arg2);
  uint16_t duration = resolveToneDuration(cmd.arg3);

  actuator->playTone(freq, duration);

  if (toneMode == TONE_BACKGROUND) {
    // Tone keeps playing; completion is reported when the hold ends
    result.holdMs = duration;
    result.completionTelemetry = toneTelemetry ? TELEM_BUZ_DONE : TELEM_NONE;
  } else if (toneTelemetry && channel) {
    channel->send(ReplyEncoder::telemetry(TELEM_BUZ_DONE, 0));
  }
}

void Executor::sendMotionTelemetry() {
  if (telemetry && motionTelemetry != TELEM_NONE) {
    telemetry->push(motionTelemetry);
  }
}
