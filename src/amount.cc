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

#include <system.hh>

#include "amount.h"

namespace kmyjournal {

const amount_t::precision_t amount_t::default_display_precision;
const amount_t::precision_t amount_t::default_max_precision;

amount_t::amount_t(const string& digits)
{
  mpq_init(quantity);
  if (digits.empty() ||
      digits.find_first_not_of("0123456789") != string::npos ||
      mpq_set_str(quantity, digits.c_str(), 10) != 0) {
    mpq_clear(quantity);
    throw_(amount_error, _f("Cannot parse '%1%' as a whole number") % digits);
  }
  mpq_canonicalize(quantity);
}

amount_t& amount_t::operator+=(const amount_t& amt)
{
  mpq_add(quantity, quantity, amt.quantity);
  return *this;
}

amount_t& amount_t::operator-=(const amount_t& amt)
{
  mpq_sub(quantity, quantity, amt.quantity);
  return *this;
}

amount_t& amount_t::operator/=(const amount_t& amt)
{
  if (amt.is_zero())
    throw_(amount_error, _("Divide by zero"));

  mpq_div(quantity, quantity, amt.quantity);
  return *this;
}

namespace {
  const char * const fraction_chars = "0123456789+-/";

  string::size_type read_number(const string&     expr,
                                string::size_type pos,
                                string&           digits)
  {
    string::size_type end = expr.find_first_not_of("0123456789", pos);
    if (end == string::npos)
      end = expr.length();
    digits = string(expr, pos, end - pos);
    return end;
  }
}

amount_t amount_t::parse_fraction(const string& expr)
{
  DEBUG("amount.parse", "Evaluating fraction expression '" << expr << "'");

  if (expr.empty())
    throw_(malformed_expression, _("Empty amount expression"));

  string::size_type bad = expr.find_first_not_of(fraction_chars);
  if (bad != string::npos) {
    add_error_context(line_context(expr, bad));
    throw_(malformed_expression,
           _f("Invalid character '%1%' in amount expression '%2%'")
           % expr[bad] % expr);
  }

  string::size_type pos = 0;
  bool negative = false;
  if (expr[0] == '-' || expr[0] == '+') {
    negative = expr[0] == '-';
    pos++;
  }

  string digits;
  pos = read_number(expr, pos, digits);
  if (digits.empty()) {
    add_error_context(line_context(expr, pos));
    throw_(malformed_expression,
           _f("Missing number in amount expression '%1%'") % expr);
  }

  amount_t result(digits);
  if (negative)
    result = result.negated();

  while (pos < expr.length()) {
    const char op = expr[pos++];

    pos = read_number(expr, pos, digits);
    if (digits.empty()) {
      add_error_context(line_context(expr, pos));
      throw_(malformed_expression,
             _f("Missing number after '%1%' in amount expression '%2%'")
             % op % expr);
    }

    amount_t operand(digits);
    switch (op) {
    case '+':
      result += operand;
      break;
    case '-':
      result -= operand;
      break;
    case '/':
      if (operand.is_zero())
        throw_(malformed_expression,
               _f("Divide by zero in amount expression '%1%'") % expr);
      result /= operand;
      break;
    default:
      assert(false);
      break;
    }
  }

  return result;
}

optional<amount_t::precision_t> amount_t::exact_precision() const
{
  // p/q in lowest terms terminates exactly when q = 2^a * 5^b, and then
  // needs max(a, b) places.
  mpz_t rest;
  mpz_t factor;
  mpz_init_set(rest, mpq_denref(quantity));
  mpz_init(factor);

  mpz_set_ui(factor, 2);
  mp_bitcnt_t twos = mpz_remove(rest, rest, factor);
  mpz_set_ui(factor, 5);
  mp_bitcnt_t fives = mpz_remove(rest, rest, factor);

  const bool terminates = mpz_cmp_ui(rest, 1) == 0;

  mpz_clear(factor);
  mpz_clear(rest);

  if (! terminates)
    return none;
  return static_cast<precision_t>(std::max(twos, fives));
}

string amount_t::to_string(const precision_t precision,
                           const precision_t max_precision) const
{
  precision_t places = precision;
  optional<precision_t> exact = exact_precision();
  if (! exact)
    places = std::max(precision, max_precision);
  else if (*exact > places)
    places = std::min(*exact, std::max(precision, max_precision));

  DEBUG("amount.convert", "Rendering with " << places << " places"
        << " (exact " << (exact ? lexical_cast<string>(*exact) : "none")
        << ")");

  // Scale to an integer count of 10^-places units and round half to
  // even, the same way the remainder is treated when rounding to a
  // commodity's display precision.
  mpz_t scale;
  mpz_t whole;
  mpz_t remainder;
  mpz_init(scale);
  mpz_init(whole);
  mpz_init(remainder);

  mpz_ui_pow_ui(scale, 10, places);
  mpz_mul(whole, mpq_numref(quantity), scale);
  mpz_fdiv_qr(whole, remainder, whole, mpq_denref(quantity));
  mpz_mul_2exp(remainder, remainder, 1);
  const int rem_denom_cmp = mpz_cmp(remainder, mpq_denref(quantity));
  if (rem_denom_cmp > 0 || (rem_denom_cmp == 0 && mpz_odd_p(whole)))
    mpz_add_ui(whole, whole, 1);

  const bool negative = mpz_sgn(whole) < 0;
  mpz_abs(whole, whole);

  char * buf = mpz_get_str(NULL, 10, whole);
  string digits(buf);
  void (*gmp_free)(void *, size_t);
  mp_get_memory_functions(NULL, NULL, &gmp_free);
  gmp_free(buf, std::strlen(buf) + 1);

  mpz_clear(remainder);
  mpz_clear(whole);
  mpz_clear(scale);

  if (digits.length() <= places)
    digits.insert(0, places + 1 - digits.length(), '0');

  std::ostringstream out;
  if (negative)
    out << '-';
  if (places > 0)
    out << digits.substr(0, digits.length() - places) << '.'
        << digits.substr(digits.length() - places);
  else
    out << digits;

  return out.str();
}

string evaluate_fraction(const string&               expr,
                         const amount_t::precision_t precision,
                         const amount_t::precision_t max_precision)
{
  return amount_t::parse_fraction(expr).to_string(precision, max_precision);
}

} // namespace kmyjournal
