/*
 * Reply Channel
 *
 * Encodes reply frames for the active profile and hands the lines to the
 * transport. Single place where replies leave the engine.
 */

#ifndef REPLY_CHANNEL_H
#define REPLY_CHANNEL_H

#include "protocol/reply_encoder.h"
#include "hal/transport.h"
#include "engine_stats.h"

class ReplyChannel {
public:
  ReplyChannel();

  void init(Transport* transport, EngineStats* stats);
  void configure(ReplyStyle style);

  // Encode and send. Returns false if the transport dropped the line.
  // A frame the style renders as nothing counts as sent.
  bool send(const ReplyFrame& frame);

  const ReplyEncoder& getEncoder() const { return encoder; }

private:
  Transport* transport;
  EngineStats* stats;
  ReplyEncoder encoder;
};

#endif // REPLY_CHANNEL_H
