/*
 * Protocol Profile Presets
 */

#include "protocol/profile.h"

Profile profileA() {
  Profile p;
  p.name = 'A';
  p.delimiter = DELIM_COLON_NEWLINE;
  p.dispatch = DISPATCH_QUEUED;
  p.busyPolicy = BUSY_WHEN_QUEUE_FULL;
  p.replies = REPLY_STYLE_VERBOSE;
  p.motion = MOTION_INSTANT;
  p.durationUnit = DURATION_SECONDS;
  p.tone = TONE_BACKGROUND;
  p.periodicTelemetry = TELEM_DIST;
  p.telemetryIntervalMs = TELEMETRY_INTERVAL_MS;
  p.motionTelemetry = TELEM_NONE;
  p.expiryTelemetry = TELEM_DIST;
  p.startupTelemetry = false;
  p.lightTelemetry = true;
  p.toneTelemetry = true;
  p.queueCapacity = DISPATCH_QUEUE_CAPACITY;
  p.ackDelayMs = 0;
  return p;
}

Profile profileB() {
  Profile p;
  p.name = 'B';
  p.delimiter = DELIM_SEMICOLON;
  p.dispatch = DISPATCH_IMMEDIATE;
  p.busyPolicy = BUSY_WHEN_QUEUE_FULL;  // Unused without a queue
  p.replies = REPLY_STYLE_ECHO;
  p.motion = MOTION_TIMED;
  p.durationUnit = DURATION_SECONDS;
  p.tone = TONE_BLOCKING;
  p.periodicTelemetry = TELEM_NONE;
  p.telemetryIntervalMs = 0;
  p.motionTelemetry = TELEM_NONE;
  p.expiryTelemetry = TELEM_NONE;
  p.startupTelemetry = false;
  p.lightTelemetry = true;
  p.toneTelemetry = true;
  p.queueCapacity = DISPATCH_QUEUE_CAPACITY;
  p.ackDelayMs = 0;
  return p;
}

Profile profileC() {
  Profile p;
  p.name = 'C';
  p.delimiter = DELIM_SEMICOLON;
  p.dispatch = DISPATCH_IMMEDIATE;
  p.busyPolicy = BUSY_WHEN_QUEUE_FULL;
  p.replies = REPLY_STYLE_TELEMETRY_ONLY;
  p.motion = MOTION_TIMED;
  p.durationUnit = DURATION_MILLISECONDS;
  p.tone = TONE_BLOCKING;
  p.periodicTelemetry = TELEM_NONE;
  p.telemetryIntervalMs = 0;
  p.motionTelemetry = TELEM_TRK;
  p.expiryTelemetry = TELEM_TRK;
  p.startupTelemetry = true;
  p.lightTelemetry = false;
  p.toneTelemetry = false;
  p.queueCapacity = DISPATCH_QUEUE_CAPACITY;
  p.ackDelayMs = 0;
  return p;
}

bool profileByName(char name, Profile& out) {
  switch (name) {
    case 'A': case 'a':
      out = profileA();
      return true;
    case 'B': case 'b':
      out = profileB();
      return true;
    case 'C': case 'c':
      out = profileC();
      return true;
    default:
      return false;
  }
}
