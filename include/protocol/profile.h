/*
 * Protocol Profile
 *
 * One value selects the wire dialect and dispatch policy of the engine.
 * Presets A/B/C cover the three deployed dialects:
 *
 *   A  ":SEQ,OP,..\n"  queued, ACK/BUSY/ERR replies, #DIST telemetry
 *   B  ";SEQ,OP,..;"   immediate, #ECHO + ";SEQ,ACK,OP;" replies
 *   C  ";SEQ,OP,..;"   immediate, telemetry-only (#TRK / #ERROR), timed GO
 */

#ifndef PROFILE_H
#define PROFILE_H

#include <stdint.h>
#include "protocol_types.h"

enum DelimiterStyle {
  DELIM_COLON_NEWLINE = 0,  // ':' prefix, '\n' terminator
  DELIM_SEMICOLON = 1       // ';' prefix and terminator
};

enum DispatchMode {
  DISPATCH_QUEUED = 0,
  DISPATCH_IMMEDIATE = 1
};

enum BusyPolicy {
  BUSY_WHEN_QUEUE_FULL = 0,  // Queue absorbs bursts while executing
  BUSY_WHEN_EXECUTING = 1    // Reject anything that arrives mid-execution
};

enum ReplyStyle {
  REPLY_STYLE_VERBOSE = 0,        // :SEQ,ACK / :SEQ,BUSY / :SEQ,ERR,EC
  REPLY_STYLE_ECHO = 1,           // #ECHO,<raw> then ;SEQ,ACK,OP;
  REPLY_STYLE_TELEMETRY_ONLY = 2  // No ACKs, only #ERROR and telemetry
};

enum MotionStyle {
  MOTION_INSTANT = 0,  // setMotors / turnLeft / turnRight, arg2 unused
  MOTION_TIMED = 1     // blocking moveTimed(direction, speed, duration)
};

enum DurationUnit {
  DURATION_MILLISECONDS = 0,
  DURATION_SECONDS = 1  // Legacy firmware: arg2 counted in whole seconds
};

enum ToneMode {
  TONE_BLOCKING = 0,
  TONE_BACKGROUND = 1  // Dispatcher holds until the tone ends
};

struct Profile {
  char name;
  DelimiterStyle delimiter;
  DispatchMode dispatch;
  BusyPolicy busyPolicy;
  ReplyStyle replies;
  MotionStyle motion;
  DurationUnit durationUnit;
  ToneMode tone;

  TelemetryKind periodicTelemetry;  // Pushed every telemetryIntervalMs
  uint32_t telemetryIntervalMs;     // 0 = no periodic telemetry
  TelemetryKind motionTelemetry;    // After MV/BK/TL/TR/SP
  TelemetryKind expiryTelemetry;    // When a GO times out
  bool startupTelemetry;            // Push motionTelemetry once at start
  bool lightTelemetry;              // #LED after HL
  bool toneTelemetry;               // #BUZ,done after BZ

  uint8_t queueCapacity;            // 1..DISPATCH_QUEUE_CAPACITY
  uint16_t ackDelayMs;              // Minimum hold before completion reply
};

Profile profileA();
Profile profileB();
Profile profileC();

// Preset by letter ('A'..'C', case-insensitive), false if unknown
bool profileByName(char name, Profile& out);

#endif // PROFILE_H
