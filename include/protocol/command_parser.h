/*
 * Command Parser
 *
 * Decodes one frame "SEQ,OP[,A1][,A2][,A3]" into a Command.
 * Tolerant of control bytes and stray delimiters from a noisy link.
 */

#ifndef COMMAND_PARSER_H
#define COMMAND_PARSER_H

#include <stddef.h>
#include "protocol_types.h"

class CommandParser {
public:
  // Returns false on structural failure (fewer than 2 fields, empty opcode).
  // An unrecognised opcode still parses, as OP_UNKNOWN.
  static bool parse(const char* frame, Command& out);

  // Drop bytes < 0x20 and ':' / ';', trim spaces. Returns output length.
  static size_t sanitize(const char* raw, char* out, size_t outSize);

private:
  static const uint8_t MAX_FIELDS = 5;
};

#endif // COMMAND_PARSER_H
