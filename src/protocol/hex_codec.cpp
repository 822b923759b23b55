/*
 * Hex Field Codec Implementation
 */

#include "protocol/hex_codec.h"

static const char HEX_DIGITS[] = "0123456789ABCDEF";

static bool isSpace(char c) {
  return c == ' ' || c == '\t';
}

int8_t hexNibble(char c) {
  if (c >= '0' && c <= '9') return (int8_t)(c - '0');
  if (c >= 'A' && c <= 'F') return (int8_t)(c - 'A' + 10);
  if (c >= 'a' && c <= 'f') return (int8_t)(c - 'a' + 10);
  return -1;
}

uint8_t hexDecodeByte(const char* field) {
  if (!field) return 0;
  while (isSpace(*field)) field++;

  uint8_t value = 0;
  for (uint8_t i = 0; i < 2 && field[i] != '\0'; i++) {
    int8_t d = hexNibble(field[i]);
    if (d < 0) break;
    value = (uint8_t)((value << 4) | d);
  }
  return value;
}

uint8_t hexDecodeSeq(const char* field) {
  if (!field) return 0;
  while (isSpace(*field)) field++;
  if (field[0] == '0' && (field[1] == 'x' || field[1] == 'X')) {
    field += 2;
  }

  uint8_t value = 0;
  for (const char* p = field; *p != '\0'; p++) {
    int8_t d = hexNibble(*p);
    if (d < 0) break;
    value = (uint8_t)((value << 4) | d);  // Shifting out high nibbles = & 0xFF
  }
  return value;
}

void hexEncodeByte(uint8_t value, char* out) {
  out[0] = HEX_DIGITS[(value >> 4) & 0x0F];
  out[1] = HEX_DIGITS[value & 0x0F];
  out[2] = '\0';
}

int32_t clampInt(int32_t value, int32_t lo, int32_t hi) {
  if (value < lo) return lo;
  if (value > hi) return hi;
  return value;
}
