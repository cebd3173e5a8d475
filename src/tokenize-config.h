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
#ifndef _FIXG_TOKENIZE_CONFIG_H
#define _FIXG_TOKENIZE_CONFIG_H

#include "config-parser.h"
#include "gcode-parser/block-parser.h"

// Configuration of the gcode-tokenize tool.
//
//   [gcode-parser]
//   accept-lowercase = yes
//   verify-checksum  = yes
//
//   [tokenize]
//   significand-bits = 32        # 16, 32 or 64
//   mul10-strategy   = multiply  # or shift-add
//   keep-going       = no
struct TokenizeConfig {
  TokenizeConfig();

  // Read values from configuration file.
  bool ConfigureFromFile(ConfigParser *config_parser);

  fixg::BlockParserConfig parser;  // Passed on to the BlockParser.

  int significand_bits;   // Width of the significand integer.
  bool shift_add;         // Use Mul10Strategy::kShiftAdd.
  bool keep_going;        // Skip erroneous blocks instead of stopping.
};

#endif  // _FIXG_TOKENIZE_CONFIG_H
