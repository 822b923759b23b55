/*
 * Line Receiver
 *
 * Byte-at-a-time frame segmentation for the line protocol.
 *
 *   Colon style:     ":05,MV,32,32\n"   ':' (re)starts a frame, '\n' ends it
 *   Semicolon style: ";07,GO,64,FF;"    every ';' ends the frame in progress
 *
 * The prefix is stripped, surrounding whitespace/control bytes are trimmed,
 * empty frames are dropped silently. A frame longer than LINE_MAX_LENGTH is
 * dropped whole and the receiver resyncs at the next terminator.
 */

#ifndef LINE_RECEIVER_H
#define LINE_RECEIVER_H

#include <stdint.h>
#include <stddef.h>
#include "config.h"
#include "protocol/profile.h"

class LineReceiver {
public:
  LineReceiver();

  void configure(DelimiterStyle style);

  // Process incoming byte, returns true if a complete frame is ready.
  // The frame stays valid until the next processByte() call.
  bool processByte(uint8_t byte);

  const char* frame() const { return buffer + frameStart; }
  size_t frameLength() const { return frameLen; }

  // Reset receiver state (drops any partial frame)
  void reset();

  uint16_t getDroppedLong() const { return droppedLong; }

private:
  enum State {
    STATE_READING,    // Accumulating frame content
    STATE_DISCARDING  // Overflowed - skip until next terminator
  };

  char buffer[LINE_MAX_LENGTH + 1];
  size_t pos;
  size_t frameStart;
  size_t frameLen;
  bool frameReady;

  State state;
  char prefix;
  char terminator;

  uint16_t droppedLong;

  bool finishFrame();
};

#endif // LINE_RECEIVER_H
