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

#include "config-parser.h"

#include <stdint.h>

#include <algorithm>
#include <fstream>
#include <iterator>

#include "common/logging.h"
#include "common/string-util.h"

bool ConfigParser::Reader::ParseString(const std::string &value,
                                       std::string *result) {
  *result = value;
  return true;
}

bool ConfigParser::Reader::ParseInt(const std::string &value, int *result) {
  int32_t parsed;
  if (!ParseFullInt32(value, &parsed)) return false;
  *result = parsed;
  return true;
}

bool ConfigParser::Reader::ParseBool(const std::string &value, bool *result) {
  const std::string v = ToLower(value);
  if (v == "1" || v == "yes" || v == "true" || v == "on") {
    *result = true;
    return true;
  }
  if (v == "0" || v == "no" || v == "false" || v == "off") {
    *result = false;
    return true;
  }
  return false;
}

void ConfigParser::Reader::ReportError(int line_no, const std::string &msg) {
  Log_error("Line %d: %s", line_no, msg.c_str());
}

ConfigParser::ConfigParser() {}

bool ConfigParser::SetContentFromFile(const char *filename) {
  if (!filename) return false;
  std::ifstream file_stream(filename, std::ios::binary);
  if (!file_stream.is_open()) return false;
  content_.assign(std::istreambuf_iterator<char>(file_stream),
                  std::istreambuf_iterator<char>());
  return !file_stream.bad();
}

void ConfigParser::SetContent(std::string_view content) {
  content_.assign(content.begin(), content.end());
}

// Extract next line out of "source" and advance it past the newline.
// A '#' starts a comment that reaches to the end of the line.
// Returns false if there are no more lines.
static bool NextLine(std::string_view *source, std::string_view *line) {
  if (source->empty()) return false;
  size_t end_of_line = source->find('\n');
  if (end_of_line == std::string_view::npos) end_of_line = source->length();
  std::string_view result = source->substr(0, end_of_line);
  source->remove_prefix(std::min(end_of_line + 1, source->length()));

  const size_t comment = result.find_first_of("#\r");
  if (comment != std::string_view::npos) result = result.substr(0, comment);
  *line = result;
  return true;
}

static std::string CanonicalizeName(std::string_view s) {
  return ToLower(TrimWhitespace(s));
}

bool ConfigParser::EmitConfigValues(Reader *reader) const {
  bool success = true;
  bool current_section_interested = false;
  std::string current_section;
  int line_no = 0;
  std::string_view content_data(content_);
  std::string_view line;
  while (NextLine(&content_data, &line)) {
    ++line_no;
    line = TrimWhitespace(line);
    if (line.empty()) continue;

    // Sections start with '['
    if (line.front() == '[') {
      if (line.back() != ']') {
        reader->ReportError(line_no, "Section line does not end in ']'");
        success = false;
        current_section_interested = false;  // rest is probably bogus.
        continue;
      }
      current_section = CanonicalizeName(line.substr(1, line.length() - 2));
      current_section_interested =
        reader->SeenSection(line_no, current_section);
      continue;
    }

    const size_t eq_pos = line.find('=');
    if (eq_pos == std::string_view::npos) {
      reader->ReportError(line_no, "name=value pair expected.");
      success = false;
      continue;
    }
    if (!current_section_interested) continue;

    const std::string name = CanonicalizeName(line.substr(0, eq_pos));
    const std::string value(TrimWhitespace(line.substr(eq_pos + 1)));
    const bool could_parse = reader->SeenNameValue(line_no, name, value);
    if (!could_parse) {
      reader->ReportError(
        line_no,
        StringPrintf("In section [%s]: Couldn't handle '%s = %s'",
                     current_section.c_str(), name.c_str(), value.c_str()));
    }
    success &= could_parse;
  }
  return success;
}
