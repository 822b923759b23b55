/*
 * Logging Implementation
 */

#include "core/log.h"
#include <stdarg.h>
#include <stdio.h>

static LogSink s_sink = nullptr;

void logSetSink(LogSink sink) {
  s_sink = sink;
}

LogSink logGetSink() {
  return s_sink;
}

void logWrite(LogLevel level, const char* tag, const char* fmt, ...) {
  if (s_sink == nullptr) {
    return;  // Nothing installed - skip formatting entirely
  }

  char buffer[96];
  va_list args;
  va_start(args, fmt);
  vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);

  s_sink(level, tag, buffer);
}

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LOG_LEVEL_VERBOSE: return "VERB";
    case LOG_LEVEL_INFO:    return "INFO";
    case LOG_LEVEL_WARN:    return "WARN";
    case LOG_LEVEL_ERROR:   return "ERROR";
    default:                return "?";
  }
}
