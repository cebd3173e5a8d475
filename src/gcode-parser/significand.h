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
#ifndef _FIXG_SIGNIFICAND_H
#define _FIXG_SIGNIFICAND_H

/*
 * Checked arithmetic on the integer that stores the significand of a
 * decimal number.
 *
 *   Mul10Strategy     - how multiplication by powers of ten is done.
 *   SignificandTraits - the operations the decimal parser needs. Specialize
 *                       for other bounded integer types if needed.
 *   AppendDigit()     - shift a significand and append one decimal digit.
 *
 * Nothing in here ever wraps around silently: each operation returns 'false'
 * on overflow, in which case the content of "result" is meaningless.
 */

#include <stdint.h>

#include <type_traits>

#include "gcode-parser/sign.h"

namespace fixg {

enum class Mul10Strategy {
  kMultiply,   // Compute 10^exp, then multiply once.
  kShiftAdd,   // x * 10 = (x << 3) + (x << 1), repeated exp times.
};

// The kShiftAdd strategy only needs checked additions. On cores without a
// cheap way to detect multiplication overflow (e.g. ARMv6-M, where MUL does
// not set the V flag and a checked multiply becomes a call to a 64 bit helper)
// this is a lot faster. Results are identical.
#ifdef FIXG_MUL10_BY_SHL
constexpr Mul10Strategy kDefaultMul10Strategy = Mul10Strategy::kShiftAdd;
#else
constexpr Mul10Strategy kDefaultMul10Strategy = Mul10Strategy::kMultiply;
#endif

// Capability of a significand type T. The generic version works for
// all built-in signed integer types.
template <typename T, Mul10Strategy M = kDefaultMul10Strategy>
struct SignificandTraits {
  static_assert(std::is_integral<T>::value && std::is_signed<T>::value,
                "Provide a SignificandTraits specialization for this type");

  typedef T value_type;

  static bool IsZero(T value) { return value == 0; }

  // Computes value * 10^exp.
  static bool MultiplyPow10(T value, uint32_t exp, T *result) {
    if (value == 0) {  // zero stays zero, even if 10^exp would not fit.
      *result = 0;
      return true;
    }
    if (M == Mul10Strategy::kShiftAdd) {
      T acc = value;
      for (/**/; exp > 0; --exp) {
        T x2, x4, x8;
        if (__builtin_add_overflow(acc, acc, &x2)) return false;
        if (__builtin_add_overflow(x2, x2, &x4)) return false;
        if (__builtin_add_overflow(x4, x4, &x8)) return false;
        if (__builtin_add_overflow(x8, x2, &acc)) return false;
      }
      *result = acc;
      return true;
    }
    T power = 1;
    for (/**/; exp > 0; --exp) {
      if (__builtin_mul_overflow(power, T(10), &power)) return false;
    }
    return !__builtin_mul_overflow(value, power, result);
  }

  static bool AddUnsigned(T value, uint32_t rhs, T *result) {
    return !__builtin_add_overflow(value, rhs, result);
  }

  static bool SubUnsigned(T value, uint32_t rhs, T *result) {
    return !__builtin_sub_overflow(value, rhs, result);
  }
};

// Converts "digit" ('0'..'9') to its value, multiplies "significand" with
// 10^exp and adds (kPositive) or subtracts (kNegative) the digit. Any
// failure, be it a non-digit or an overflow in any of the steps, returns
// 'false'; the caller can't tell which.
template <typename T, typename Traits = SignificandTraits<T>>
bool AppendDigit(T significand, uint32_t exp, char digit, Sign sign,
                 T *result) {
  if (digit < '0' || digit > '9') return false;
  const uint32_t digit_value = digit - '0';
  T shifted;
  if (!Traits::MultiplyPow10(significand, exp, &shifted)) return false;
  return (sign == Sign::kPositive)
    ? Traits::AddUnsigned(shifted, digit_value, result)
    : Traits::SubUnsigned(shifted, digit_value, result);
}

}  // namespace fixg

#endif  // _FIXG_SIGNIFICAND_H
