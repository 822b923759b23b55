/*
 * Hex Field Codec
 *
 * Tolerant hex readers for command fields and the two-digit encoder used in
 * replies. Also hosts the integer clamp shared by the executor.
 */

#ifndef HEX_CODEC_H
#define HEX_CODEC_H

#include <stdint.h>
#include <stddef.h>

// Value of one hex character, -1 if not hex (case-insensitive)
int8_t hexNibble(char c);

// Read up to two hex characters after trimming whitespace.
// Stops at the first non-hex character; empty/unparseable → 0.
// "" → 0, "1" → 1, "FF" → 255, "G1" → 0, "1G" → 1
uint8_t hexDecodeByte(const char* field);

// Read every leading hex digit after trimming whitespace and an optional
// 0x prefix, keep the low 8 bits. Used for sequence numbers
// ("123" → 0x23, "0x05" → 0x05, "zz" → 0).
uint8_t hexDecodeSeq(const char* field);

// Write two uppercase hex digits plus terminator into out[3]
void hexEncodeByte(uint8_t value, char* out);

int32_t clampInt(int32_t value, int32_t lo, int32_t hi);

#endif // HEX_CODEC_H
