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
 * @addtogroup util
 */

/**
 * @file   normalize.h
 * @author John Wiegley
 *
 * @ingroup util
 *
 * @brief Text rules that make free text safe inside journal syntax.
 *
 * Colons separate account path segments, semicolons start comments,
 * the vertical bar separates payee from note and brackets mark virtual
 * postings, so none of them may appear unescaped in names or comments.
 * There are two profiles: escaped() for free text in comments, and
 * formatted() for account names and other label tokens, which are also
 * lowercased and have KMyMoney's top-level account names mapped onto the
 * journal's account types.
 */
#ifndef _NORMALIZE_H
#define _NORMALIZE_H

#include "utils.h"

namespace kmyjournal {

extern const string default_newline_separator;

/**
 * Replace every newline with `separator`.  Blank text yields "".
 */
string replace_newlines(const string& str,
                        const string& separator = default_newline_separator);

/**
 * Replace each of the characters `: ; | [ ]` with a space.  Blank text
 * yields "".
 */
string replace_special_characters(const string& str);

/**
 * Trim both ends and condense runs of whitespace to one space.  Blank
 * text yields "".
 */
string trim_and_condense(const string& str);

string lowered(const string& str);
string capitalized(const string& str);

string escaped(const string& str,
               const string& separator = default_newline_separator);
string formatted(const string& str,
                 const string& separator = default_newline_separator);

/**
 * If `name` (already lowercased) is one of KMyMoney's five top-level
 * account names, return the journal account type it maps to.
 */
optional<string> top_level_account(const string& name);

/**
 * Label for a KMyMoney attribute written as comment metadata.  Ledger
 * and hledger read "type:" as an account type tag, so that attribute is
 * renamed "kmymoney-type".
 */
string attribute_label(const string& name);

/**
 * Rewrite KMyMoney's yyyy-mm-dd dates as yyyy/mm/dd.  This is a textual
 * substitution only; nothing is validated.  Blank text yields "".
 */
string to_journal_date(const string& str);

} // namespace kmyjournal

#endif // _NORMALIZE_H
