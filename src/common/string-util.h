/* -*- mode: c++; c-basic-offset: 2; indent-tabs-mode: nil; -*-
 * (c) 2015 Henner Zeller <h.zeller@acm.org>
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
#ifndef _FIXG_STRING_UTIL_H
#define _FIXG_STRING_UTIL_H

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <string_view>

// String helpers for the host side: configuration and tools. Not to be used
// by the parser core, which does not allocate.

// Define this with empty, if you're not using gcc.
#define PRINTF_FMT_CHECK(fmt_pos, args_pos) \
  __attribute__((format(printf, fmt_pos, args_pos)))

// Trim std::string_view of whitespace front and back and return trimmed
// string.
std::string_view TrimWhitespace(std::string_view s);

// Lowercase the string (simple ASCII) and return as newly allocated
// std::string
std::string ToLower(std::string_view in);

// Formatted printing into a string.
std::string StringPrintf(const char *format, ...) PRINTF_FMT_CHECK(1, 2);

// Parse a decimal number from a std::string_view into "result". Leading
// whitespace and a '+' are skipped. Returns the end of the number on
// success, nullptr otherwise.
// So this can be used in a simple boolean context for simple success
// testing, but as well in parsing context where advancing to the next position
// is needed.
const char *convert_strto32(std::string_view s, int32_t *result);

// Like convert_strto32(), but the whole string (modulo surrounding
// whitespace) needs to be the number.
bool ParseFullInt32(std::string_view s, int32_t *result);

#undef PRINTF_FMT_CHECK
#endif  // _FIXG_STRING_UTIL_H
