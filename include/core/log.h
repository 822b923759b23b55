/*
 * Logging Macros
 *
 * Structured logging with subsystem prefixes.
 * The engine never writes to a UART itself; lines go to whatever sink the
 * firmware (or a test) installs. No sink installed = logs dropped.
 */

#ifndef LOG_H
#define LOG_H

#include <stdint.h>
#include "../config.h"

enum LogLevel {
  LOG_LEVEL_VERBOSE = 0,
  LOG_LEVEL_INFO = 1,
  LOG_LEVEL_WARN = 2,
  LOG_LEVEL_ERROR = 3
};

// Sink receives one formatted message (no trailing newline)
typedef void (*LogSink)(LogLevel level, const char* tag, const char* message);

void logSetSink(LogSink sink);
LogSink logGetSink();

// printf-style entry point used by the macros below
void logWrite(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
  __attribute__((format(printf, 3, 4)))
#endif
  ;

const char* logLevelName(LogLevel level);

#if ENABLE_VERBOSE_LOGS
#define LOG_V(tag, fmt, ...) logWrite(LOG_LEVEL_VERBOSE, tag, fmt, ##__VA_ARGS__)
#else
#define LOG_V(tag, fmt, ...) do {} while(0)
#endif

#define LOG_I(tag, fmt, ...) logWrite(LOG_LEVEL_INFO, tag, fmt, ##__VA_ARGS__)
#define LOG_W(tag, fmt, ...) logWrite(LOG_LEVEL_WARN, tag, fmt, ##__VA_ARGS__)
#define LOG_E(tag, fmt, ...) logWrite(LOG_LEVEL_ERROR, tag, fmt, ##__VA_ARGS__)

#endif // LOG_H
