/*
 * Engine Diagnostic Counters
 */

#include "engine_stats.h"

void engineStatsReset(EngineStats& stats) {
  stats.frames_received = 0;
  stats.frames_dropped_long = 0;
  stats.parse_errors = 0;
  stats.busy_rejections = 0;
  stats.unknown_opcodes = 0;
  stats.stop_failures = 0;
  stats.tx_dropped = 0;
  stats.last_cmd_ms = 0;
}
