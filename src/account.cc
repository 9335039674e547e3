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

#include "account.h"

namespace kmyjournal {

optional<xml::node_id_t>
account_resolver_t::parent(const xml::node_id_t account) const
{
  optional<const string&> parent_id =
    document[account].get_attr("parentaccount");
  if (! parent_id)
    return none;

  optional<xml::node_id_t> parent_node = accounts.find(*parent_id);
  if (! parent_node && ! parent_id->empty())
    DEBUG("account.path", "Account '" << document[account].attr("id")
          << "' has unknown parent '" << *parent_id << "'");
  return parent_node;
}

string account_resolver_t::resolve(const xml::node_id_t account,
                                   const path_style_t   style,
                                   std::size_t          depth)
{
  paths_map::iterator i = paths.find(path_key(account, style));
  if (i != paths.end())
    return (*i).second;

  // Any chain longer than the number of accounts must revisit one.
  if (depth > accounts.size())
    throw_(conversion_error,
           _f("The parent accounts of '%1%' form a cycle")
           % document[account].attr("id"));

  const string& name(document[account].attr("name"));

  string fullname;
  if (optional<xml::node_id_t> up = parent(account))
    fullname = resolve(*up, style, depth + 1) + ":";

  if (style == DECLARATION_PATH)
    fullname += formatted(name, newline_separator);
  else
    fullname += escaped(name, newline_separator);

  paths.insert(paths_map::value_type(path_key(account, style), fullname));
  return fullname;
}

string account_resolver_t::path(const xml::node_id_t account,
                                const path_style_t   style)
{
  return resolve(account, style, 0);
}

optional<string> account_resolver_t::path_of(const string&      id,
                                             const path_style_t style)
{
  if (optional<xml::node_id_t> account = accounts.find(id))
    return path(*account, style);
  return none;
}

} // namespace kmyjournal
