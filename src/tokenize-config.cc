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

#include "tokenize-config.h"

#include <string>

#include "common/logging.h"

TokenizeConfig::TokenizeConfig()
  : significand_bits(32), shift_add(false), keep_going(false) {
#ifdef FIXG_MUL10_BY_SHL
  shift_add = true;
#endif
}

namespace {
class TokenizeConfigReader : public ConfigParser::Reader {
public:
  explicit TokenizeConfigReader(TokenizeConfig *config) : config_(config) {}

  bool SeenSection(int line_no, const std::string &section_name) final {
    current_section_ = section_name;
    return section_name == "gcode-parser" || section_name == "tokenize";
  }

  bool SeenNameValue(int line_no,
                     const std::string &name,
                     const std::string &value) final {
#define ACCEPT_VALUE(n, T, result) if (name != n) {} else return Parse##T(value, result)

    if (current_section_ == "gcode-parser") {
      ACCEPT_VALUE("accept-lowercase", Bool, &config_->parser.accept_lowercase);
      ACCEPT_VALUE("verify-checksum",  Bool, &config_->parser.verify_checksum);
      return false;
    }

    if (current_section_ == "tokenize") {
      ACCEPT_VALUE("keep-going", Bool, &config_->keep_going);
      if (name == "significand-bits") {
        int bits;
        if (!ParseInt(value, &bits)) return false;
        if (bits != 16 && bits != 32 && bits != 64) {
          ReportError(line_no, "significand-bits needs to be 16, 32 or 64");
          return false;
        }
        config_->significand_bits = bits;
        return true;
      }
      if (name == "mul10-strategy") {
        if (value == "multiply") {
          config_->shift_add = false;
          return true;
        }
        if (value == "shift-add") {
          config_->shift_add = true;
          return true;
        }
        return false;
      }
      return false;
    }
#undef ACCEPT_VALUE

    return false;
  }

private:
  TokenizeConfig *const config_;
  std::string current_section_;
};
}  // namespace

bool TokenizeConfig::ConfigureFromFile(ConfigParser *config_parser) {
  TokenizeConfigReader reader(this);
  const bool success = config_parser->EmitConfigValues(&reader);
  Log_debug("Config: significand %d bit, %s; lowercase: %s; checksum: %s",
            significand_bits, shift_add ? "shift-add" : "multiply",
            parser.accept_lowercase ? "yes" : "no",
            parser.verify_checksum ? "verify" : "ignore");
  return success;
}
