/*
 * Serial Transport
 *
 * Transport over an Arduino Stream (the UNO UART).
 * Writes never block: a line that does not fit the TX buffer is parked in a
 * single pending slot and flushed later. A line arriving while the slot is
 * still occupied is dropped and reported to the caller.
 */

#ifndef SERIAL_TRANSPORT_H
#define SERIAL_TRANSPORT_H

#include <Arduino.h>
#include "config.h"
#include "hal/transport.h"

class SerialTransport : public Transport {
public:
  SerialTransport();

  void init(HardwareSerial* port, void (*idleHook)() = nullptr);

  bool sendLine(const char* line);
  int available();
  int read();

  // Push the pending line out once the TX buffer has room
  void flushPending();

private:
  HardwareSerial* port;
  void (*idleHook)();

  char pendingLine[REPLY_MAX_LENGTH];
  bool hasPending;

  bool canWrite(size_t len);
  void writeLine(const char* line);
};

#endif // SERIAL_TRANSPORT_H
