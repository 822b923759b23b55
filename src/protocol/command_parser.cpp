/*
 * Command Parser Implementation
 */

#include "protocol/command_parser.h"
#include "protocol/hex_codec.h"
#include <string.h>

static const char* const OPCODE_NAMES[] = {
  "MV", "BK", "TL", "TR", "SP", "GO", "HL", "BZ", "EC"
};
static const uint8_t OPCODE_COUNT = sizeof(OPCODE_NAMES) / sizeof(OPCODE_NAMES[0]);

const char* opcodeName(Opcode op) {
  if ((uint8_t)op < OPCODE_COUNT) {
    return OPCODE_NAMES[op];
  }
  return "??";
}

Opcode opcodeFromText(const char* text) {
  if (!text) return OP_UNKNOWN;
  for (uint8_t i = 0; i < OPCODE_COUNT; i++) {
    if (strcmp(text, OPCODE_NAMES[i]) == 0) {
      return (Opcode)i;
    }
  }
  return OP_UNKNOWN;
}

// Trim spaces in place, returns pointer to first non-space char
static char* trimField(char* field) {
  while (*field == ' ' || *field == '\t') field++;
  size_t len = strlen(field);
  while (len > 0 && (field[len - 1] == ' ' || field[len - 1] == '\t')) {
    field[--len] = '\0';
  }
  return field;
}

size_t CommandParser::sanitize(const char* raw, char* out, size_t outSize) {
  if (outSize == 0) return 0;
  out[0] = '\0';
  if (!raw) return 0;

  size_t len = 0;
  for (const char* p = raw; *p != '\0' && len < outSize - 1; p++) {
    uint8_t code = (uint8_t)*p;
    if (code < 0x20) continue;
    if (*p == ';' || *p == ':') continue;
    out[len++] = *p;
  }
  out[len] = '\0';

  // Trim in place
  size_t start = 0;
  while (start < len && out[start] == ' ') start++;
  while (len > start && out[len - 1] == ' ') len--;
  if (start > 0) {
    memmove(out, out + start, len - start);
  }
  len -= start;
  out[len] = '\0';
  return len;
}

bool CommandParser::parse(const char* frame, Command& out) {
  char clean[LINE_MAX_LENGTH + 1];
  size_t len = sanitize(frame, clean, sizeof(clean));
  if (len < 2) {
    return false;
  }

  // Split on ',' in place
  char* fields[MAX_FIELDS];
  uint8_t fieldCount = 0;
  fields[fieldCount++] = clean;
  for (char* p = clean; *p != '\0'; p++) {
    if (*p == ',') {
      *p = '\0';
      if (fieldCount < MAX_FIELDS) {
        fields[fieldCount++] = p + 1;
      } else {
        break;  // Extra fields ignored
      }
    }
  }
  if (fieldCount < 2) {
    return false;
  }

  char* op = trimField(fields[1]);
  if (*op == '\0') {
    return false;
  }
  for (char* p = op; *p != '\0'; p++) {
    if (*p >= 'a' && *p <= 'z') *p = (char)(*p - 'a' + 'A');
  }

  out.seq = hexDecodeSeq(fields[0]);
  strncpy(out.opText, op, sizeof(out.opText) - 1);
  out.opText[sizeof(out.opText) - 1] = '\0';
  out.opcode = opcodeFromText(op);
  out.arg1 = fieldCount > 2 ? hexDecodeByte(fields[2]) : 0;
  out.arg2 = fieldCount > 3 ? hexDecodeByte(fields[3]) : 0;
  out.arg3 = fieldCount > 4 ? hexDecodeByte(fields[4]) : 0;
  return true;
}
