/*
 * Transport Capability Interface
 *
 * Byte stream in, whole lines out. Segmentation is the LineReceiver's job.
 */

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <stdint.h>

class Transport {
public:
  virtual ~Transport() {}

  // Send one complete line (already '\n' terminated).
  // Returns false if the line was dropped.
  virtual bool sendLine(const char* line) = 0;

  // Bytes waiting to be read
  virtual int available() = 0;

  // Next byte, or -1 if none
  virtual int read() = 0;
};

#endif // TRANSPORT_H
