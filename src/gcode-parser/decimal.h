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
#ifndef _FIXG_DECIMAL_H
#define _FIXG_DECIMAL_H

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <string_view>

#include "gcode-parser/sign.h"
#include "gcode-parser/significand.h"

namespace fixg {

// A decimal number significand * 10^(-negative_exponent).
//
// The sign is part of the significand; there is no distinction between
// positive and negative zero. The negative exponent is the number of digits
// right of the decimal point. For a machine working in meters, 25um is
// stored as significand 25 and negative exponent 6.
template <typename S>
class Decimal {
public:
  Decimal() : significand_(), negative_exponent_(0) {}
  Decimal(S significand, uint32_t negative_exponent)
    : significand_(significand), negative_exponent_(negative_exponent) {}

  S significand() const { return significand_; }
  uint32_t negative_exponent() const { return negative_exponent_; }

  bool operator==(const Decimal<S> &other) const {
    return significand_ == other.significand_
      && negative_exponent_ == other.negative_exponent_;
  }
  bool operator!=(const Decimal<S> &other) const { return !(*this == other); }

private:
  S significand_;
  uint32_t negative_exponent_;
};

enum class DecimalError {
  kNone = 0,
  kCapacity,          // Number does not fit into the significand.
  kIncomplete,        // Finished before any digit was seen.
  kInvalidCharacter,  // Character not allowed at this position.
};

// Name of the error for messages, e.g. "Capacity".
const char *DecimalErrorName(DecimalError error);

// Parser for one decimal literal such as "-12.50" or ".5". Characters are
// fed one at a time; nothing is buffered. Call Finish() after the last
// character to get the value.
//
// After an error, the parser must be Reset() before it is used again.
template <typename S, typename Traits = SignificandTraits<S>>
class DecimalParser {
public:
  DecimalParser() { Reset(); }

  void Reset() {
    state_ = STATE_START;
    had_sign_ = false;
    sign_ = Sign::kPositive;
    significand_ = S();
    negative_exponent_ = 0;
    trailing_zeros_plus_one_ = 1;
  }

  DecimalError Feed(char c);

  // Feed all characters of "str"; stops at the first error. If "consumed"
  // is given, it receives the number of characters accepted, which on error
  // is the index of the offending character.
  DecimalError Feed(std::string_view str, size_t *consumed = nullptr) {
    size_t pos = 0;
    DecimalError err = DecimalError::kNone;
    for (/**/; pos < str.size(); ++pos) {
      err = Feed(str[pos]);
      if (err != DecimalError::kNone) break;
    }
    if (consumed) *consumed = pos;
    return err;
  }

  // Returns kIncomplete if no digit has been seen yet, kNone otherwise
  // with "result" filled.
  DecimalError Finish(Decimal<S> *result) const {
    if (state_ != STATE_INTEGER && state_ != STATE_FRACTION) {
      return DecimalError::kIncomplete;
    }
    *result = Decimal<S>(significand_, negative_exponent_);
    return DecimalError::kNone;
  }

  // True while only digits have been fed, i.e. the input so far could be
  // read as an unsigned integer.
  bool IsPlainInteger() const {
    return state_ == STATE_INTEGER && !had_sign_;
  }

private:
  friend class DecimalParserTestPeer;

  enum State {
    STATE_START,
    STATE_SIGN,
    STATE_LEADING_DECIMAL,  // '.' before any integer digit.
    STATE_INTEGER,
    STATE_FRACTION,
  };

  State state_;
  bool had_sign_;
  Sign sign_;
  S significand_;
  uint32_t negative_exponent_;

  // Zeros right of the decimal point are not multiplied in right away but
  // counted; the next non-zero digit then shifts by all of them at once.
  // Starts at one, the weight of the next digit.
  uint32_t trailing_zeros_plus_one_;
};

template <typename S, typename Traits>
DecimalError DecimalParser<S, Traits>::Feed(char c) {
  switch (state_) {
  case STATE_START:
    if (c == '+' || c == '-') {
      had_sign_ = true;
      if (c == '-') sign_ = Sign::kNegative;
      state_ = STATE_SIGN;
      return DecimalError::kNone;
    }
    // fallthrough
  case STATE_SIGN:
    if (c == '.') {
      state_ = STATE_LEADING_DECIMAL;
      return DecimalError::kNone;
    }
    // fallthrough
  case STATE_INTEGER:
    if (c == '.') {   // Only reachable from STATE_INTEGER.
      state_ = STATE_FRACTION;
      return DecimalError::kNone;
    }
    if (c < '0' || c > '9') return DecimalError::kInvalidCharacter;
    if (c == '0' && Traits::IsZero(significand_)) {
      state_ = STATE_INTEGER;   // Leading zero, nothing to add.
      return DecimalError::kNone;
    }
    if (!AppendDigit<S, Traits>(significand_, 1, c, sign_, &significand_)) {
      return DecimalError::kCapacity;
    }
    state_ = STATE_INTEGER;
    return DecimalError::kNone;

  case STATE_LEADING_DECIMAL:
  case STATE_FRACTION:
    if (c == '0') {
      if (__builtin_add_overflow(trailing_zeros_plus_one_, 1u,
                                 &trailing_zeros_plus_one_)) {
        return DecimalError::kCapacity;
      }
      state_ = STATE_FRACTION;
      return DecimalError::kNone;
    }
    if (c < '1' || c > '9') return DecimalError::kInvalidCharacter;
    S shifted;
    uint32_t exponent;
    if (!AppendDigit<S, Traits>(significand_, trailing_zeros_plus_one_, c,
                                sign_, &shifted)
        || __builtin_add_overflow(negative_exponent_, trailing_zeros_plus_one_,
                                  &exponent)) {
      return DecimalError::kCapacity;
    }
    significand_ = shifted;
    negative_exponent_ = exponent;
    trailing_zeros_plus_one_ = 1;
    state_ = STATE_FRACTION;
    return DecimalError::kNone;
  }
  return DecimalError::kInvalidCharacter;
}

// Writes "number" in plain decimal notation to "buffer" with exactly
// negative_exponent() digits after the decimal point, e.g. "-0.025".
// Returns the length the full string would have, like snprintf().
template <typename S>
int FormatDecimal(const Decimal<S> &number, char *buffer, size_t size) {
  // Largest magnitude we format is that of int64_t; collect digits backwards.
  char digits[24];
  int count = 0;
  const int64_t value = static_cast<int64_t>(number.significand());
  // Work on the negative magnitude, which can represent INT64_MIN.
  int64_t rest = (value > 0) ? -value : value;
  do {
    digits[count++] = '0' - (rest % 10);
    rest /= 10;
  } while (rest != 0 && count < (int)sizeof(digits));

  const uint32_t frac = number.negative_exponent();
  int len = 0;
  auto emit = [&](char c) {
    if ((size_t)len + 1 < size) buffer[len] = c;
    ++len;
  };
  if (value < 0) emit('-');
  if ((uint32_t)count <= frac) {
    emit('0');
    emit('.');
    for (uint32_t i = count; i < frac; ++i) emit('0');
    for (int i = count - 1; i >= 0; --i) emit(digits[i]);
  } else {
    for (int i = count - 1; i >= 0; --i) {
      emit(digits[i]);
      if (frac > 0 && (uint32_t)i == frac) emit('.');
    }
  }
  if (size > 0) buffer[std::min((size_t)len, size - 1)] = '\0';
  return len;
}

}  // namespace fixg

#endif  // _FIXG_DECIMAL_H
