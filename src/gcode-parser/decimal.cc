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

#include "gcode-parser/decimal.h"

namespace fixg {

const char *DecimalErrorName(DecimalError error) {
  switch (error) {
  case DecimalError::kNone:             return "None";
  case DecimalError::kCapacity:         return "Capacity";
  case DecimalError::kIncomplete:       return "Incomplete";
  case DecimalError::kInvalidCharacter: return "InvalidCharacter";
    // no default to have compiler warn about new values.
  }
  return "?";
}

}  // namespace fixg
