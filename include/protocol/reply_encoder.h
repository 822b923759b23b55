/*
 * Reply Encoder
 *
 * Renders ReplyFrames as literal wire lines for the active profile.
 *
 *   Verbose:        ":05,ACK\n"  ":0A,BUSY\n"  ":05,ERR,02\n"
 *   Echo:           ";05,ACK,MV;\n"  ";00,ACK,??;\n"  "#ERROR,<code>\n"
 *   Telemetry-only: ACK silent, "#ERROR,<code>\n"
 *   Telemetry (all): "#DIST,<cm>\n" "#LED,<RRGGBB>\n" "#BUZ,done\n"
 *                    "#TRK,<n>\n" "#ECHO,<raw>\n"
 */

#ifndef REPLY_ENCODER_H
#define REPLY_ENCODER_H

#include <stddef.h>
#include "protocol_types.h"
#include "profile.h"

class ReplyEncoder {
public:
  ReplyEncoder();

  void configure(ReplyStyle style);
  ReplyStyle getStyle() const { return style; }

  // Render into buffer (always '\n' terminated line).
  // Returns line length, or 0 if the style sends nothing for this frame
  // or the buffer is too small.
  size_t encode(const ReplyFrame& frame, char* buffer, size_t bufferSize) const;

  // Frame builders
  static ReplyFrame ack(const Command& cmd);
  static ReplyFrame busy(uint8_t seq);
  static ReplyFrame error(uint8_t seq, ErrorCode code, const char* opText = nullptr);
  static ReplyFrame telemetry(TelemetryKind kind, uint32_t value);
  static ReplyFrame echo(const char* raw);

  // "PARSE_FAIL", "UNKNOWN_OP_<op>", "GO_INVALID_ARGS"
  static size_t errorName(ErrorCode code, const char* opText, char* buffer, size_t bufferSize);

private:
  ReplyStyle style;

  size_t encodeTelemetry(const ReplyFrame& frame, char* buffer, size_t bufferSize) const;
};

#endif // REPLY_ENCODER_H
