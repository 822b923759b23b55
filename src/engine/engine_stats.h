/*
 * Engine Diagnostic Counters
 */

#ifndef ENGINE_STATS_H
#define ENGINE_STATS_H

#include <stdint.h>

struct EngineStats {
  uint16_t frames_received;      // Non-empty frames handed to the parser
  uint16_t frames_dropped_long;  // Frames exceeding LINE_MAX_LENGTH
  uint16_t parse_errors;         // Structural parse failures
  uint16_t busy_rejections;      // Commands answered with BUSY
  uint16_t unknown_opcodes;      // Commands with an unrecognised opcode
  uint16_t stop_failures;        // Actuator stop() not confirmed
  uint16_t tx_dropped;           // Lines the transport refused
  uint32_t last_cmd_ms;          // Timestamp of last valid command
};

void engineStatsReset(EngineStats& stats);

#endif // ENGINE_STATS_H
