/*
 * Line Receiver Implementation
 */

#include "line_receiver.h"
#include "core/log.h"

static bool isTrimmable(char c) {
  return (uint8_t)c < 0x20 || c == ' ';
}

LineReceiver::LineReceiver()
  : pos(0)
  , frameStart(0)
  , frameLen(0)
  , frameReady(false)
  , state(STATE_READING)
  , prefix(':')
  , terminator('\n')
  , droppedLong(0)
{
  buffer[0] = '\0';
}

void LineReceiver::configure(DelimiterStyle style) {
  if (style == DELIM_SEMICOLON) {
    prefix = ';';
    terminator = ';';
  } else {
    prefix = ':';
    terminator = '\n';
  }
  reset();
}

void LineReceiver::reset() {
  pos = 0;
  frameStart = 0;
  frameLen = 0;
  frameReady = false;
  state = STATE_READING;
  buffer[0] = '\0';
}

bool LineReceiver::processByte(uint8_t byte) {
  // Previous frame was handed out - start over
  if (frameReady) {
    frameReady = false;
    pos = 0;
    frameStart = 0;
    frameLen = 0;
  }

  char c = (char)byte;

  if (c == terminator) {
    if (state == STATE_DISCARDING) {
      // Tail of an overlong frame - resynced, ready for next frame
      state = STATE_READING;
      pos = 0;
      return false;
    }
    return finishFrame();
  }

  if (state == STATE_DISCARDING) {
    return false;
  }

  if (c == prefix) {
    // New frame start in middle of old frame - discard old and start fresh
    pos = 0;
    return false;
  }

  if (byte == 0x00) {
    return false;  // Would truncate the C string
  }

  if (pos < LINE_MAX_LENGTH) {
    buffer[pos++] = c;
  } else {
    droppedLong++;
    state = STATE_DISCARDING;
    pos = 0;
    LOG_W("RX", "frame over %d bytes dropped", LINE_MAX_LENGTH);
  }
  return false;
}

bool LineReceiver::finishFrame() {
  buffer[pos] = '\0';

  size_t start = 0;
  size_t end = pos;
  while (start < end && isTrimmable(buffer[start])) start++;
  while (end > start && isTrimmable(buffer[end - 1])) end--;

  pos = 0;
  if (end == start) {
    return false;  // Empty frame (e.g. the leading ';' of the next command)
  }

  buffer[end] = '\0';
  frameStart = start;
  frameLen = end - start;
  frameReady = true;
  return true;
}
