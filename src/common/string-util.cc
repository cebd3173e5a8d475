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

#include "common/string-util.h"

#include <ctype.h>
#include <stdarg.h>
#include <stdio.h>

#include <algorithm>
#include <charconv>

std::string_view TrimWhitespace(std::string_view s) {
  while (!s.empty() && isspace(s.front())) s.remove_prefix(1);
  while (!s.empty() && isspace(s.back())) s.remove_suffix(1);
  return s;
}

std::string ToLower(std::string_view in) {
  std::string result(in.length(), ' ');
  std::transform(in.begin(), in.end(), result.begin(), ::tolower);
  return result;
}

const char *convert_strto32(std::string_view s, int32_t *result) {
  while (!s.empty() && isspace(s.front())) s.remove_prefix(1);
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  auto success = std::from_chars(s.data(), s.data() + s.size(), *result);
  return (success.ec == std::errc()) ? success.ptr : nullptr;
}

bool ParseFullInt32(std::string_view s, int32_t *result) {
  s = TrimWhitespace(s);
  const char *end = convert_strto32(s, result);
  return end != nullptr && end == s.data() + s.size();
}

static void vAppendf(std::string *str, const char *format, va_list ap) {
  va_list ap_copy;
  va_copy(ap_copy, ap);
  const int needed = vsnprintf(nullptr, 0, format, ap_copy);
  va_end(ap_copy);
  if (needed <= 0) return;
  const size_t orig_len = str->length();
  str->resize(orig_len + needed + 1);
  vsnprintf((char *)str->data() + orig_len, needed + 1, format, ap);
  str->resize(orig_len + needed);
}

std::string StringPrintf(const char *format, ...) {
  va_list ap;
  va_start(ap, format);
  std::string result;
  vAppendf(&result, format, ap);
  va_end(ap);
  return result;
}
