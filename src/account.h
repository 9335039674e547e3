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
 * @addtogroup data
 */

/**
 * @file   account.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Full hierarchical names of KMyMoney accounts.
 */
#ifndef _ACCOUNT_H
#define _ACCOUNT_H

#include "index.h"
#include "normalize.h"

namespace kmyjournal {

DECLARE_EXCEPTION(conversion_error, std::runtime_error);

enum path_style_t {
  DECLARATION_PATH,             // formatted(): lowercased, typed roots
  COMMENT_PATH                  // escaped(): original case
};

/**
 * @class account_resolver_t
 *
 * @brief Resolves an account's colon-joined path, root first.
 *
 * KMyMoney links each account to its parent through the "parentaccount"
 * attribute.  The chain ends at an account with no such attribute, or
 * whose parent id does not resolve in the accounts index; a dangling
 * parent id is not an error.  Each segment is the account's "name"
 * normalized for the requested style, and an account without a name
 * contributes an empty segment.  Resolved paths are cached for the
 * lifetime of the resolver.
 */
class account_resolver_t : public noncopyable
{
  typedef std::pair<xml::node_id_t, path_style_t> path_key;
  typedef std::map<path_key, string>              paths_map;

  const xml::document_t& document;
  const entity_index_t&  accounts;
  string                 newline_separator;
  paths_map              paths;

  string resolve(const xml::node_id_t account, const path_style_t style,
                 std::size_t depth);

public:
  account_resolver_t(const xml::document_t& _document,
                     const entity_index_t&  _accounts,
                     const string&          _newline_separator =
                       default_newline_separator)
    : document(_document), accounts(_accounts),
      newline_separator(_newline_separator) {
    assert(accounts.kind() == ACCOUNTS);
  }

  optional<xml::node_id_t> parent(const xml::node_id_t account) const;

  string path(const xml::node_id_t account, const path_style_t style);

  /**
   * Path of the account with the given id, or none if the id does not
   * resolve.
   */
  optional<string> path_of(const string& id, const path_style_t style);
};

} // namespace kmyjournal

#endif // _ACCOUNT_H
