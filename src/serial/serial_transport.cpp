/*
 * Serial Transport Implementation
 */

#include "serial_transport.h"
#include <string.h>

SerialTransport::SerialTransport()
  : port(nullptr)
  , idleHook(nullptr)
  , hasPending(false)
{
  pendingLine[0] = '\0';
}

void SerialTransport::init(HardwareSerial* p, void (*hook)()) {
  port = p;
  idleHook = hook;
  hasPending = false;
  pendingLine[0] = '\0';
}

bool SerialTransport::canWrite(size_t len) {
  return port && (size_t)port->availableForWrite() >= len;
}

void SerialTransport::writeLine(const char* line) {
  if (idleHook) {
    idleHook();
  }
  port->write((const uint8_t*)line, strlen(line));
}

bool SerialTransport::sendLine(const char* line) {
  if (!port || !line) {
    return false;
  }

  // Keep line order: anything parked goes first
  flushPending();

  size_t len = strlen(line);
  if (!hasPending && canWrite(len)) {
    writeLine(line);
    return true;
  }

  if (hasPending || len >= sizeof(pendingLine)) {
    return false;
  }

  memcpy(pendingLine, line, len + 1);
  hasPending = true;
  return true;
}

void SerialTransport::flushPending() {
  if (!hasPending) {
    return;
  }
  if (canWrite(strlen(pendingLine))) {
    writeLine(pendingLine);
    hasPending = false;
  }
}

int SerialTransport::available() {
  return port ? port->available() : 0;
}

int SerialTransport::read() {
  return port ? port->read() : -1;
}
