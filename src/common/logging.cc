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
#include "common/logging.h"

#include <fcntl.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/uio.h>
#include <syslog.h>
#include <time.h>
#include <unistd.h>

static int log_fd = STDERR_FILENO;  // Allow logging before Log_init().
static bool debug_enabled = false;

static const char *const kInfoHighlight  = "\033[1mINFO  ";
static const char *const kDebugHighlight = "\033[1m\033[34mDEBUG ";
static const char *const kErrorHighlight = "\033[1m\033[31mERROR ";
static const char *const kTermReset      = "\033[0m";

static const char *debug_markup_start_ = "DEBUG ";
static const char *info_markup_start_  = "INFO  ";
static const char *error_markup_start_ = "ERROR ";
static const char *markup_end_ = "";

static void SetColorMarkup(bool enable_color) {
  if (enable_color) {
    info_markup_start_ = kInfoHighlight;
    debug_markup_start_ = kDebugHighlight;
    error_markup_start_ = kErrorHighlight;
    markup_end_ = kTermReset;
  } else {
    info_markup_start_ = "INFO  ";
    debug_markup_start_ = "DEBUG ";
    error_markup_start_ = "ERROR ";
    markup_end_ = "";
  }
}

void Log_init(const char *filename) {
  if (filename == NULL || strlen(filename) == 0) {
    openlog(NULL, LOG_PID|LOG_CONS, LOG_USER);
    log_fd = -1;
    return;
  }
  // "-" is an explicit request for stderr.
  if (strcmp(filename, "-") == 0) {
    log_fd = STDERR_FILENO;
  } else {
    log_fd = open(filename, O_CREAT|O_APPEND|O_WRONLY, 0644);
    if (log_fd < 0) {
      perror("Cannot open logfile");
      openlog(NULL, LOG_PID|LOG_CONS, LOG_USER); // fallback.
      return;
    }
  }
  SetColorMarkup(isatty(log_fd));
}

void Log_enable_debug(bool enable) { debug_enabled = enable; }

static void Log_internal(int fd, const char *markup_start,
                         const char *format, va_list ap) {
  struct timeval now;
  gettimeofday(&now, NULL);
  struct tm time_breakdown;
  localtime_r(&now.tv_sec, &time_breakdown);
  char fmt_buf[128];
  strftime(fmt_buf, sizeof(fmt_buf), "%F %T", &time_breakdown);

  // Assemble in a local buffer so that one line is one write().
  char header[192];
  char message[1024];
  struct iovec parts[3];
  int header_len = snprintf(header, sizeof(header), "%s[%s.%06ld]%s ",
                            markup_start, fmt_buf, (long)now.tv_usec,
                            markup_end_);
  int message_len = vsnprintf(message, sizeof(message), format, ap);
  if (header_len < 0) header_len = 0;
  if (message_len < 0) message_len = 0;
  if ((size_t)header_len >= sizeof(header)) header_len = sizeof(header) - 1;
  if ((size_t)message_len >= sizeof(message)) {
    message_len = sizeof(message) - 1;
  }
  parts[0].iov_base = header;
  parts[0].iov_len = header_len;
  parts[1].iov_base = message;
  parts[1].iov_len = message_len;
  parts[2].iov_base = (void*) "\n";
  parts[2].iov_len = 1;
  const bool already_newline =
    (message_len > 0 && message[message_len - 1] == '\n');
  if (writev(fd, parts, already_newline ? 2 : 3) < 0) {
    // Logging trouble. Ignore.
  }
}

void Log_debug(const char *format, ...) {
  if (!debug_enabled || log_fd < 0) return;
  va_list ap;
  va_start(ap, format);
  Log_internal(log_fd, debug_markup_start_, format, ap);
  va_end(ap);
}

void Log_info(const char *format, ...) {
  va_list ap;
  va_start(ap, format);
  if (log_fd < 0) {
    vsyslog(LOG_INFO, format, ap);
  } else {
    Log_internal(log_fd, info_markup_start_, format, ap);
  }
  va_end(ap);
}

void Log_error(const char *format, ...) {
  va_list ap;
  va_start(ap, format);
  if (log_fd < 0) {
    vsyslog(LOG_ERR, format, ap);
  } else {
    Log_internal(log_fd, error_markup_start_, format, ap);
  }
  va_end(ap);
}
