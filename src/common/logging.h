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

#ifndef _FIXG_LOGGING_H
#define _FIXG_LOGGING_H

// Logging for the host side tools. The parser core itself never logs; it
// returns errors that the caller might want to log here.

// With filename given, logs debug, info and error to that file.
// If filename is NULL or empty, info and errors are logged to syslog.
// Before Log_init() is called, everything goes to stderr.
void Log_init(const char *filename);

// Debug messages are suppressed unless enabled. Off by default.
void Log_enable_debug(bool enable);

// Define this with empty, if you're not using gcc.
#define PRINTF_FMT_CHECK(fmt_pos, args_pos)             \
  __attribute__ ((format (printf, fmt_pos, args_pos)))

void Log_debug(const char *format, ...) PRINTF_FMT_CHECK(1, 2);
void Log_info(const char *format, ...) PRINTF_FMT_CHECK(1, 2);
void Log_error(const char *format, ...) PRINTF_FMT_CHECK(1, 2);

#undef PRINTF_FMT_CHECK

#endif /* _FIXG_LOGGING_H */
