/*
 * Configuration Constants
 *
 * System-wide configuration for the botlink protocol engine.
 * Every value can be overridden with a -D build flag.
 *
 * IMPORTANT: Arduino UNO has only 2KB RAM!
 * Buffers below are sized for the UNO; host builds use the same values.
 */

#ifndef CONFIG_H
#define CONFIG_H

// Serial Communication
#ifndef SERIAL_BAUD
#define SERIAL_BAUD 115200
#endif

// Line receiver buffer (bytes between delimiters, delimiter excluded)
#ifndef LINE_MAX_LENGTH
#define LINE_MAX_LENGTH 64
#endif

// Longest reply/telemetry line, including "\n" and terminator
#ifndef REPLY_MAX_LENGTH
#define REPLY_MAX_LENGTH 80
#endif

// Opcode text kept for UNKNOWN_OP_<op> reports (31 chars + NUL).
// Stored per queued command, so it stays well under LINE_MAX_LENGTH.
#ifndef OPCODE_TEXT_MAX
#define OPCODE_TEXT_MAX 32
#endif

// Dispatcher
#ifndef DISPATCH_QUEUE_CAPACITY
#define DISPATCH_QUEUE_CAPACITY 6
#endif
#define DISPATCH_PUMP_MS 10

// Task intervals (ms)
#ifndef TIMER_TICK_MS
#define TIMER_TICK_MS 100          // GO expiry polling
#endif
#ifndef TELEMETRY_INTERVAL_MS
#define TELEMETRY_INTERVAL_MS 500  // Periodic sensor push
#endif
#define TASK_PROTOCOL_RX_MS 1
#define RX_BYTES_PER_POLL 48       // Bytes drained per RX task call
#define TASK_DIAGNOSTICS_MS 5000

// Speed range in percent, scaled to PWM by the board adapter
#define SPEED_MIN 0
#define SPEED_MAX 100
#define SPEED_BACKWARD_DEFAULT 50  // BK with arg1 == 0

// Buzzer
#define TONE_FREQ_MIN_HZ 100
#define TONE_FREQ_MAX_HZ 5000
#define TONE_DURATION_UNIT_MS 10   // arg3 * 10 ms
#define TONE_DURATION_DEFAULT_MS 100

// Boot profile: preset letter plus optional overrides, see profile_config.h
#ifndef BOOT_PROFILE_JSON
#define BOOT_PROFILE_JSON "{\"base\":\"C\"}"
#endif

// Verbose logging (LOG_V) and debug sink on the command UART
#ifndef ENABLE_VERBOSE_LOGS
#define ENABLE_VERBOSE_LOGS 0
#endif
#ifndef ENABLE_DEBUG_LOG
#define ENABLE_DEBUG_LOG 0
#endif

// Firmware Version
#define FW_VERSION_MAJOR 1
#define FW_VERSION_MINOR 2
#define FW_VERSION_PATCH 0
#define FW_VERSION_STRING "1.2.0"

#endif // CONFIG_H
