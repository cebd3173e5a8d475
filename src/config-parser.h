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
#ifndef _FIXG_CONFIG_PARSER_H
#define _FIXG_CONFIG_PARSER_H

#include <string>
#include <string_view>

// The config parser reads an ini-style configuration file
//
//   [section]
//   name = value    # comment
//
// and passes tokenized values to a ConfigParser::Reader. Section and value
// names are canonicalized to lower case.
class ConfigParser {
public:
  // A reader has to be implemented by a subsystem that needs configuration
  // from the file.
  class Reader {
  public:
    virtual ~Reader() {}

    // Inform about new section. If the Reader is interested in
    // name/value pairs seen in that section, it should return 'true'.
    virtual bool SeenSection(int line_no, const std::string &section_name) = 0;

    // SeenNameValue() is only called if this Reader expressed interest
    // in the current section. Returns 'true' if it could deal with the
    // name/value, 'false' if there was an error and the configuration should
    // be deemed invalid.
    virtual bool SeenNameValue(int line_no,
                               const std::string &name,
                               const std::string &value) = 0;

    // Default implementation logs the error.
    virtual void ReportError(int line_no, const std::string &msg);

  protected:
    // Convenience functions that can be used in derived readers.
    static bool ParseString(const std::string &value, std::string *result);
    static bool ParseInt(const std::string &value, int *result);
    static bool ParseBool(const std::string &value, bool *result);
  };

  ConfigParser();

  // Set content of configuration by reading from the file. Returns 'true'
  // if reading the file was successful.
  // Overwrites any previous content.
  bool SetContentFromFile(const char *filename);

  // Set content of configuration file as one string. Typically useful in
  // unit tests.
  // Overwrites any previous content.
  void SetContent(std::string_view content);

  // Emit configuration values to the Reader for all sections it is interested
  // in. Can be called many times with different Readers.
  //
  // Returns 'true' if configuration file could be parsed (no syntax errors,
  // and all calls to SeenNameValue() returned true).
  //
  // Reader-ownership is not taken over.
  bool EmitConfigValues(Reader *reader) const;

private:
  std::string content_;
};
#endif // _FIXG_CONFIG_PARSER_H
