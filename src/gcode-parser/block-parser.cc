/* -*- mode: c++; c-basic-offset: 2; indent-tabs-mode: nil; -*-
 * (c) 2026 The FixG Authors
 *
 * This file is part of FixG.
 *
 * FixG is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * FixG is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with FixG.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "gcode-parser/block-parser.h"

#include <stdio.h>

namespace fixg {

const char *BlockErrorKindName(BlockErrorKind kind) {
  switch (kind) {
  case BlockErrorKind::kNone:                return "None";
  case BlockErrorKind::kInvalidCharacter:    return "InvalidCharacter";
  case BlockErrorKind::kMisplacedWord:       return "MisplacedWord";
  case BlockErrorKind::kUnterminatedComment: return "UnterminatedComment";
  case BlockErrorKind::kChecksum:            return "Checksum";
  case BlockErrorKind::kDecimal:             return "Decimal";
  case BlockErrorKind::kBuilder:             return "Builder";
    // no default to have compiler warn about new values.
  }
  return "?";
}

// Control characters, most notably the newline, are shown escaped.
static void PrintableChar(char c, char out[5]) {
  switch (c) {
  case '\n': snprintf(out, 5, "\\n"); break;
  case '\r': snprintf(out, 5, "\\r"); break;
  case '\t': snprintf(out, 5, "\\t"); break;
  default:
    if ((unsigned char)c < 0x20 || (unsigned char)c >= 0x7f) {
      snprintf(out, 5, "\\x%02x", (unsigned char)c);
    } else {
      out[0] = c;
      out[1] = '\0';
    }
  }
}

int FormatBlockError(const BlockErrorInfo &error, char *buffer, size_t size) {
  char printable[5];
  PrintableChar(error.character, printable);

  char decimal_detail[32] = "";
  if (error.kind == BlockErrorKind::kDecimal) {
    snprintf(decimal_detail, sizeof(decimal_detail), " (%s)",
             DecimalErrorName(error.decimal_error));
  }
  char word_detail[16] = "";
  if (error.address != '\0') {
    snprintf(word_detail, sizeof(word_detail), " in word '%c'",
             error.address);
  }
  return snprintf(buffer, size, "%u:%u: %s%s%s at '%s'",
                  (unsigned)error.line, (unsigned)error.column,
                  BlockErrorKindName(error.kind),
                  decimal_detail, word_detail, printable);
}

}  // namespace fixg
