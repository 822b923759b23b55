/*
 * Profile Configuration
 *
 * JSON profile documents on top of the A/B/C presets:
 *
 *   {"base":"A","busy":"executing","capacity":4,"ack_delay_ms":50}
 *
 * "base" picks the preset, every other key overrides one field. On any
 * error the output profile is left untouched, so the caller keeps whatever
 * it had.
 */

#ifndef PROFILE_CONFIG_H
#define PROFILE_CONFIG_H

#include <stddef.h>
#include <stdint.h>
#include "protocol/profile.h"
#include "engine/engine_stats.h"

enum ConfigError {
  CONFIG_OK = 0,
  CONFIG_BAD_JSON = 1,      // Not a JSON object
  CONFIG_UNKNOWN_BASE = 2,  // Missing or unknown "base" letter
  CONFIG_BAD_VALUE = 3      // Wrong type, unknown choice or out of range
};

class ProfileConfig {
public:
  static ConfigError load(const char* json, Profile& out);

  // Compact JSON rendering of the counters, 0 if it did not fit
  static size_t formatStats(const EngineStats& stats, char* buffer, size_t bufferSize);

  static const char* errorName(ConfigError error);
};

#endif // PROFILE_CONFIG_H
