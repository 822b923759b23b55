/*
 * Reply Channel Implementation
 */

#include "reply_channel.h"
#include "core/log.h"

ReplyChannel::ReplyChannel()
  : transport(nullptr)
  , stats(nullptr)
{
}

void ReplyChannel::init(Transport* t, EngineStats* s) {
  transport = t;
  stats = s;
}

void ReplyChannel::configure(ReplyStyle style) {
  encoder.configure(style);
}

bool ReplyChannel::send(const ReplyFrame& frame) {
  char line[REPLY_MAX_LENGTH];
  size_t len = encoder.encode(frame, line, sizeof(line));
  if (len == 0) {
    return true;  // Nothing on the wire for this style
  }

  if (!transport || !transport->sendLine(line)) {
    if (stats) {
      stats->tx_dropped++;
    }
    LOG_V("TX", "dropped %u byte line", (unsigned)len);
    return false;
  }
  return true;
}
