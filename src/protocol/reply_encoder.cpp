/*
 * Reply Encoder Implementation
 */

#include "protocol/reply_encoder.h"
#include "protocol/hex_codec.h"
#include <stdio.h>
#include <string.h>

// snprintf result → line length, 0 if it did not fit
static size_t fitted(int written, size_t bufferSize) {
  if (written < 0 || (size_t)written >= bufferSize) {
    return 0;
  }
  return (size_t)written;
}

static ReplyFrame blankFrame(ReplyKind kind) {
  ReplyFrame f;
  f.kind = kind;
  f.seq = 0;
  f.opcode = OP_UNKNOWN;
  f.error = ERR_NONE;
  f.telemetry = TELEM_NONE;
  f.value = 0;
  f.text[0] = '\0';
  return f;
}

static void copyText(ReplyFrame& f, const char* text) {
  if (!text) {
    f.text[0] = '\0';
    return;
  }
  strncpy(f.text, text, sizeof(f.text) - 1);
  f.text[sizeof(f.text) - 1] = '\0';
}

ReplyEncoder::ReplyEncoder()
  : style(REPLY_STYLE_VERBOSE)
{
}

void ReplyEncoder::configure(ReplyStyle replyStyle) {
  style = replyStyle;
}

ReplyFrame ReplyEncoder::ack(const Command& cmd) {
  ReplyFrame f = blankFrame(REPLY_ACK);
  f.seq = cmd.seq;
  f.opcode = cmd.opcode;
  copyText(f, cmd.opText);
  return f;
}

ReplyFrame ReplyEncoder::busy(uint8_t seq) {
  ReplyFrame f = blankFrame(REPLY_BUSY);
  f.seq = seq;
  return f;
}

ReplyFrame ReplyEncoder::error(uint8_t seq, ErrorCode code, const char* opText) {
  ReplyFrame f = blankFrame(REPLY_ERR);
  f.seq = seq;
  f.error = code;
  copyText(f, opText);
  return f;
}

ReplyFrame ReplyEncoder::telemetry(TelemetryKind kind, uint32_t value) {
  ReplyFrame f = blankFrame(REPLY_TELEMETRY);
  f.telemetry = kind;
  f.value = value;
  return f;
}

ReplyFrame ReplyEncoder::echo(const char* raw) {
  ReplyFrame f = blankFrame(REPLY_TELEMETRY);
  f.telemetry = TELEM_ECHO;
  copyText(f, raw);
  return f;
}

size_t ReplyEncoder::errorName(ErrorCode code, const char* opText, char* buffer, size_t bufferSize) {
  int n;
  switch (code) {
    case ERR_PARSE_FAIL:
      n = snprintf(buffer, bufferSize, "PARSE_FAIL");
      break;
    case ERR_UNKNOWN_OP:
      n = snprintf(buffer, bufferSize, "UNKNOWN_OP_%s", opText ? opText : "");
      break;
    case ERR_GO_INVALID_ARGS:
      n = snprintf(buffer, bufferSize, "GO_INVALID_ARGS");
      break;
    default:
      n = snprintf(buffer, bufferSize, "ERR_%02X", (unsigned)code);
      break;
  }
  return fitted(n, bufferSize);
}

size_t ReplyEncoder::encode(const ReplyFrame& frame, char* buffer, size_t bufferSize) const {
  if (bufferSize == 0) return 0;
  buffer[0] = '\0';

  char seqHex[3];
  hexEncodeByte(frame.seq, seqHex);

  switch (frame.kind) {
    case REPLY_ACK:
      if (style == REPLY_STYLE_VERBOSE) {
        return fitted(snprintf(buffer, bufferSize, ":%s,ACK\n", seqHex), bufferSize);
      }
      if (style == REPLY_STYLE_ECHO) {
        const char* op = frame.text[0] ? frame.text : opcodeName(frame.opcode);
        return fitted(snprintf(buffer, bufferSize, ";%s,ACK,%s;\n", seqHex, op), bufferSize);
      }
      return 0;  // Telemetry-only: success is silent

    case REPLY_BUSY:
      if (style == REPLY_STYLE_VERBOSE) {
        return fitted(snprintf(buffer, bufferSize, ":%s,BUSY\n", seqHex), bufferSize);
      }
      if (style == REPLY_STYLE_ECHO) {
        return fitted(snprintf(buffer, bufferSize, ";%s,BUSY;\n", seqHex), bufferSize);
      }
      return fitted(snprintf(buffer, bufferSize, "#ERROR,BUSY\n"), bufferSize);

    case REPLY_ERR: {
      if (style == REPLY_STYLE_VERBOSE) {
        char code[3];
        hexEncodeByte((uint8_t)frame.error, code);
        return fitted(snprintf(buffer, bufferSize, ":%s,ERR,%s\n", seqHex, code), bufferSize);
      }
      if (style == REPLY_STYLE_ECHO && frame.error == ERR_PARSE_FAIL) {
        return fitted(snprintf(buffer, bufferSize, ";00,ACK,??;\n"), bufferSize);
      }
      char name[OPCODE_TEXT_MAX + 16];
      if (errorName(frame.error, frame.text, name, sizeof(name)) == 0) {
        return 0;
      }
      return fitted(snprintf(buffer, bufferSize, "#ERROR,%s\n", name), bufferSize);
    }

    case REPLY_TELEMETRY:
      return encodeTelemetry(frame, buffer, bufferSize);

    default:
      return 0;
  }
}

size_t ReplyEncoder::encodeTelemetry(const ReplyFrame& frame, char* buffer, size_t bufferSize) const {
  int n;
  switch (frame.telemetry) {
    case TELEM_DIST:
      n = snprintf(buffer, bufferSize, "#DIST,%lu\n", (unsigned long)frame.value);
      break;
    case TELEM_LED:
      n = snprintf(buffer, bufferSize, "#LED,%06lX\n", (unsigned long)(frame.value & 0xFFFFFFUL));
      break;
    case TELEM_BUZ_DONE:
      n = snprintf(buffer, bufferSize, "#BUZ,done\n");
      break;
    case TELEM_TRK:
      n = snprintf(buffer, bufferSize, "#TRK,%lu\n", (unsigned long)(frame.value & 0x03));
      break;
    case TELEM_ECHO:
      n = snprintf(buffer, bufferSize, "#ECHO,%s\n", frame.text);
      break;
    default:
      return 0;
  }
  return fitted(n, bufferSize);
}
