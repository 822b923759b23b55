/*
 * Profile Configuration Implementation
 */

#include "profile_config.h"
#include "core/log.h"
#include "config.h"
#include <ArduinoJson.h>
#include <string.h>

// One profile document: every key set, keys and strings copied
#define CONFIG_JSON_DOC_SIZE (JSON_OBJECT_SIZE(18) + 320)
#define STATS_JSON_DOC_SIZE JSON_OBJECT_SIZE(8)

// Choice tables, index == enum value
static const char* const DELIMITER_NAMES[] = { "colon", "semicolon" };
static const char* const DISPATCH_NAMES[] = { "queued", "immediate" };
static const char* const BUSY_NAMES[] = { "queue_full", "executing" };
static const char* const REPLY_NAMES[] = { "verbose", "echo", "telemetry" };
static const char* const MOTION_NAMES[] = { "instant", "timed" };
static const char* const DURATION_NAMES[] = { "ms", "s" };
static const char* const TONE_NAMES[] = { "blocking", "background" };

#define CHOICE_COUNT(table) ((uint8_t)(sizeof(table) / sizeof(table[0])))

// Absent key -> true, value untouched. Known string -> true, index stored.
static bool readChoice(JsonVariantConst v, const char* const* names, uint8_t count, uint8_t& index) {
  if (v.isNull()) {
    return true;
  }
  const char* text = v.as<const char*>();
  if (!text) {
    return false;
  }
  for (uint8_t i = 0; i < count; i++) {
    if (strcmp(text, names[i]) == 0) {
      index = i;
      return true;
    }
  }
  return false;
}

static bool readTelemetryKind(JsonVariantConst v, TelemetryKind& kind) {
  if (v.isNull()) {
    return true;
  }
  const char* text = v.as<const char*>();
  if (!text) {
    return false;
  }
  if (strcmp(text, "none") == 0) {
    kind = TELEM_NONE;
  } else if (strcmp(text, "dist") == 0) {
    kind = TELEM_DIST;
  } else if (strcmp(text, "trk") == 0) {
    kind = TELEM_TRK;
  } else {
    return false;
  }
  return true;
}

static bool readFlag(JsonVariantConst v, bool& flag) {
  if (v.isNull()) {
    return true;
  }
  if (!v.is<bool>()) {
    return false;
  }
  flag = v.as<bool>();
  return true;
}

ConfigError ProfileConfig::load(const char* json, Profile& out) {
  if (!json) {
    return CONFIG_BAD_JSON;
  }

  StaticJsonDocument<CONFIG_JSON_DOC_SIZE> doc;
  DeserializationError error = deserializeJson(doc, json);
  if (error) {
    LOG_W("CFG", "json: %s", error.c_str());
    return CONFIG_BAD_JSON;
  }
  if (!doc.is<JsonObject>()) {
    return CONFIG_BAD_JSON;
  }
  JsonObjectConst root = doc.as<JsonObjectConst>();

  const char* base = root["base"].as<const char*>();
  Profile p;
  if (!base || strlen(base) != 1 || !profileByName(base[0], p)) {
    return CONFIG_UNKNOWN_BASE;
  }

  uint8_t delimiter = (uint8_t)p.delimiter;
  uint8_t dispatch = (uint8_t)p.dispatch;
  uint8_t busy = (uint8_t)p.busyPolicy;
  uint8_t replies = (uint8_t)p.replies;
  uint8_t motion = (uint8_t)p.motion;
  uint8_t duration = (uint8_t)p.durationUnit;
  uint8_t tone = (uint8_t)p.tone;

  bool ok = readChoice(root["delimiter"], DELIMITER_NAMES, CHOICE_COUNT(DELIMITER_NAMES), delimiter)
         && readChoice(root["dispatch"], DISPATCH_NAMES, CHOICE_COUNT(DISPATCH_NAMES), dispatch)
         && readChoice(root["busy"], BUSY_NAMES, CHOICE_COUNT(BUSY_NAMES), busy)
         && readChoice(root["replies"], REPLY_NAMES, CHOICE_COUNT(REPLY_NAMES), replies)
         && readChoice(root["motion"], MOTION_NAMES, CHOICE_COUNT(MOTION_NAMES), motion)
         && readChoice(root["duration"], DURATION_NAMES, CHOICE_COUNT(DURATION_NAMES), duration)
         && readChoice(root["tone"], TONE_NAMES, CHOICE_COUNT(TONE_NAMES), tone)
         && readTelemetryKind(root["telemetry"], p.periodicTelemetry)
         && readTelemetryKind(root["motion_telemetry"], p.motionTelemetry)
         && readTelemetryKind(root["expiry_telemetry"], p.expiryTelemetry)
         && readFlag(root["startup_telemetry"], p.startupTelemetry)
         && readFlag(root["light_telemetry"], p.lightTelemetry)
         && readFlag(root["tone_telemetry"], p.toneTelemetry);
  if (!ok) {
    return CONFIG_BAD_VALUE;
  }

  JsonVariantConst interval = root["telemetry_ms"];
  if (!interval.isNull()) {
    if (!interval.is<uint32_t>()) {
      return CONFIG_BAD_VALUE;
    }
    p.telemetryIntervalMs = interval.as<uint32_t>();
  }

  JsonVariantConst capacity = root["capacity"];
  if (!capacity.isNull()) {
    if (!capacity.is<uint8_t>()) {
      return CONFIG_BAD_VALUE;
    }
    uint8_t cap = capacity.as<uint8_t>();
    if (cap < 1 || cap > DISPATCH_QUEUE_CAPACITY) {
      return CONFIG_BAD_VALUE;
    }
    p.queueCapacity = cap;
  }

  JsonVariantConst ackDelay = root["ack_delay_ms"];
  if (!ackDelay.isNull()) {
    if (!ackDelay.is<uint16_t>()) {
      return CONFIG_BAD_VALUE;
    }
    p.ackDelayMs = ackDelay.as<uint16_t>();
  }

  p.delimiter = (DelimiterStyle)delimiter;
  p.dispatch = (DispatchMode)dispatch;
  p.busyPolicy = (BusyPolicy)busy;
  p.replies = (ReplyStyle)replies;
  p.motion = (MotionStyle)motion;
  p.durationUnit = (DurationUnit)duration;
  p.tone = (ToneMode)tone;

  out = p;
  return CONFIG_OK;
}

size_t ProfileConfig::formatStats(const EngineStats& stats, char* buffer, size_t bufferSize) {
  if (!buffer || bufferSize == 0) {
    return 0;
  }

  StaticJsonDocument<STATS_JSON_DOC_SIZE> doc;
  doc["rx"] = stats.frames_received;
  doc["long"] = stats.frames_dropped_long;
  doc["parse"] = stats.parse_errors;
  doc["busy"] = stats.busy_rejections;
  doc["unk"] = stats.unknown_opcodes;
  doc["stop"] = stats.stop_failures;
  doc["txd"] = stats.tx_dropped;
  doc["last"] = stats.last_cmd_ms;

  if (measureJson(doc) >= bufferSize) {
    buffer[0] = '\0';
    return 0;
  }
  return serializeJson(doc, buffer, bufferSize);
}

const char* ProfileConfig::errorName(ConfigError error) {
  switch (error) {
    case CONFIG_OK:           return "ok";
    case CONFIG_BAD_JSON:     return "bad_json";
    case CONFIG_UNKNOWN_BASE: return "unknown_base";
    case CONFIG_BAD_VALUE:    return "bad_value";
    default:                  return "?";
  }
}
