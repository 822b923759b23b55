/*
 * Protocol Types
 *
 * Commands decoded from the line protocol and the replies sent back.
 */

#ifndef PROTOCOL_TYPES_H
#define PROTOCOL_TYPES_H

#include <stdint.h>
#include "../config.h"

// Opcodes (Host → Robot)
enum Opcode {
  OP_MV = 0,   // Move forward
  OP_BK,       // Move backward
  OP_TL,       // Turn left
  OP_TR,       // Turn right
  OP_SP,       // Hard stop
  OP_GO,       // Timed run (supervised)
  OP_HL,       // Headlights
  OP_BZ,       // Buzzer
  OP_EC,       // Echo / no-op
  OP_UNKNOWN
};

struct Command {
  uint8_t seq;
  Opcode opcode;
  uint8_t arg1;
  uint8_t arg2;
  uint8_t arg3;
  char opText[OPCODE_TEXT_MAX];  // Uppercased opcode as received
};

// Error taxonomy surfaced in replies
enum ErrorCode {
  ERR_NONE = 0x00,
  ERR_PARSE_FAIL = 0x01,
  ERR_UNKNOWN_OP = 0x02,
  ERR_GO_INVALID_ARGS = 0x03
};

// Reply kinds (Robot → Host)
enum ReplyKind {
  REPLY_ACK = 0,
  REPLY_BUSY,
  REPLY_ERR,
  REPLY_TELEMETRY
};

enum TelemetryKind {
  TELEM_NONE = 0,
  TELEM_DIST,      // #DIST,<cm>
  TELEM_LED,       // #LED,<RRGGBB>
  TELEM_BUZ_DONE,  // #BUZ,done
  TELEM_TRK,       // #TRK,<0-3>
  TELEM_ECHO       // #ECHO,<raw>
};

// Tagged union of everything the engine can send
struct ReplyFrame {
  ReplyKind kind;
  uint8_t seq;                   // ACK/BUSY/ERR
  Opcode opcode;                 // ACK op echo
  ErrorCode error;               // ERR
  TelemetryKind telemetry;       // TELEMETRY
  uint32_t value;                // TELEMETRY numeric payload (cm, rgb, bitmask)
  char text[LINE_MAX_LENGTH + 1];  // ACK/ERR op text, ECHO raw frame
};

const char* opcodeName(Opcode op);
Opcode opcodeFromText(const char* text);

#endif // PROTOCOL_TYPES_H
