/*
 * Copyright (c) 2003-2018, John Wiegley.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of New Artisans LLC nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @addtogroup math
 */

/**
 * @file   amount.h
 * @author John Wiegley
 *
 * @ingroup math
 *
 * @brief Exact amounts parsed from KMyMoney fraction expressions.
 *
 * KMyMoney stores every monetary value as a small arithmetic
 * expression, usually a ratio such as "-12345/100".  This file contains
 * amount_t, an infinite-precision rational number backed by GMP, and
 * the evaluator that turns such expressions into amounts and back into
 * canonical decimal text for the journal.
 */
#ifndef _AMOUNT_H
#define _AMOUNT_H

#include "utils.h"

namespace kmyjournal {

DECLARE_EXCEPTION(amount_error, std::runtime_error);
DECLARE_EXCEPTION(malformed_expression, amount_error);

/**
 * @class amount_t
 *
 * @brief Encapsulates an infinite-precision uncommoditized amount.
 *
 * Internal precision is always exact; rounding only ever happens when
 * the amount is rendered as text by to_string().
 */
class amount_t
{
public:
  typedef uint_least16_t precision_t;

  /**
   * The default number of decimal places shown for an amount, and the
   * largest number of places shown before rounding takes place.
   */
  static const precision_t default_display_precision = 2;
  static const precision_t default_max_precision     = 8;

protected:
  mpq_t quantity;

public:
  amount_t() {
    mpq_init(quantity);
  }
  amount_t(const long val) {
    mpq_init(quantity);
    mpq_set_si(quantity, val, 1);
  }
  explicit amount_t(const string& digits);
  amount_t(const amount_t& amt) {
    mpq_init(quantity);
    mpq_set(quantity, amt.quantity);
  }
  ~amount_t() {
    mpq_clear(quantity);
  }

  amount_t& operator=(const amount_t& amt) {
    if (this != &amt)
      mpq_set(quantity, amt.quantity);
    return *this;
  }

  /**
   * Evaluate a KMyMoney fraction expression, `[+-]N (('+'|'-'|'/') N)*`,
   * strictly from left to right.  There is no operator precedence, so
   * "1+2/4" is (1+2)/4.  Throws malformed_expression for any text that
   * does not fit the grammar, and for division by zero.
   */
  static amount_t parse_fraction(const string& expr);

  amount_t& operator+=(const amount_t& amt);
  amount_t& operator-=(const amount_t& amt);
  amount_t& operator/=(const amount_t& amt);

  amount_t negated() const {
    amount_t temp(*this);
    mpq_neg(temp.quantity, temp.quantity);
    return temp;
  }

  bool operator==(const amount_t& amt) const {
    return mpq_equal(quantity, amt.quantity) != 0;
  }
  bool operator!=(const amount_t& amt) const {
    return ! (*this == amt);
  }

  int sign() const {
    return mpq_sgn(quantity);
  }
  bool is_zero() const {
    return sign() == 0;
  }

  /**
   * Returns the number of decimal places needed to write this amount
   * exactly, or none if its decimal expansion never terminates (1/3).
   */
  optional<precision_t> exact_precision() const;

  /**
   * Render the amount as a decimal string.  At least `precision` places
   * are written; more are written when the exact value needs them, up
   * to `max_precision`, after which the value is rounded half to even.
   */
  string to_string(const precision_t precision     = default_display_precision,
                   const precision_t max_precision = default_max_precision) const;

  friend std::ostream& operator<<(std::ostream& out, const amount_t& amt) {
    out << amt.to_string();
    return out;
  }
};

/**
 * Shorthand for amount_t::parse_fraction(expr).to_string(...).
 */
string evaluate_fraction(const string& expr,
                         const amount_t::precision_t precision =
                           amount_t::default_display_precision,
                         const amount_t::precision_t max_precision =
                           amount_t::default_max_precision);

} // namespace kmyjournal

#endif // _AMOUNT_H
