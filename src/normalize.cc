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

#include "normalize.h"
#include "unistring.h"

namespace kmyjournal {

const string default_newline_separator(" => ");

namespace {
  struct top_level_pair {
    const char * kmymoney_name;
    const char * journal_name;
  };

  // Journal account types are asset, liability, equity, revenue and
  // expense; KMyMoney calls revenue "income".
  const top_level_pair top_level_accounts[] = {
    { "asset",     "asset" },
    { "equity",    "equity" },
    { "expense",   "expense" },
    { "income",    "revenue" },
    { "liability", "liability" }
  };
  const std::size_t top_level_accounts_size =
    sizeof(top_level_accounts) / sizeof(top_level_accounts[0]);

  const boost::regex special_chars_re("[:;|\\[\\]]");
  const boost::regex whitespace_re("\\s+");
  const boost::regex date_re("(....)-(..)-(..)");
}

string replace_newlines(const string& str, const string& separator)
{
  if (is_blank(str))
    return empty_string;
  return boost::algorithm::replace_all_copy(str, "\n", separator);
}

string replace_special_characters(const string& str)
{
  if (is_blank(str))
    return empty_string;
  return boost::regex_replace(str, special_chars_re, " ");
}

string trim_and_condense(const string& str)
{
  if (is_blank(str))
    return empty_string;
  return boost::regex_replace(boost::algorithm::trim_copy(str),
                              whitespace_re, " ");
}

string lowered(const string& str)
{
  unistring chars(str);
  for (std::size_t i = 0; i < chars.length(); i++)
    chars[i] = static_cast<uint32_t>(u_tolower(static_cast<UChar32>(chars[i])));
  return chars.extract();
}

string capitalized(const string& str)
{
  unistring chars(str);
  for (std::size_t i = 0; i < chars.length(); i++) {
    UChar32 ch = static_cast<UChar32>(chars[i]);
    chars[i] = static_cast<uint32_t>(i == 0 ? u_toupper(ch) : u_tolower(ch));
  }
  return chars.extract();
}

string escaped(const string& str, const string& separator)
{
  if (is_blank(str))
    return str;

  return trim_and_condense
    (replace_special_characters(replace_newlines(str, separator)));
}

string formatted(const string& str, const string& separator)
{
  if (is_blank(str))
    return str;

  string result = trim_and_condense
    (replace_special_characters(lowered(replace_newlines(str, separator))));

  if (optional<string> type = top_level_account(result))
    return *type;
  return result;
}

optional<string> top_level_account(const string& name)
{
  for (std::size_t i = 0; i < top_level_accounts_size; i++)
    if (name == top_level_accounts[i].kmymoney_name)
      return string(top_level_accounts[i].journal_name);
  return none;
}

string attribute_label(const string& name)
{
  return name == "type" ? string("kmymoney-type") : name;
}

string to_journal_date(const string& str)
{
  if (is_blank(str))
    return empty_string;
  return boost::regex_replace(str, date_re, "$1/$2/$3");
}

} // namespace kmyjournal
