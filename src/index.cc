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

#include "index.h"

namespace kmyjournal {

const char * entity_path(const entity_kind_t kind)
{
  switch (kind) {
  case INSTITUTIONS: return "KMYMONEY-FILE/INSTITUTIONS/INSTITUTION";
  case PAYEES:       return "KMYMONEY-FILE/PAYEES/PAYEE";
  case ACCOUNTS:     return "KMYMONEY-FILE/ACCOUNTS/ACCOUNT";
  case TRANSACTIONS: return "KMYMONEY-FILE/TRANSACTIONS/TRANSACTION";
  case REPORTS:      return "KMYMONEY-FILE/REPORTS/REPORT";
  }
  assert(false);
  return NULL;
}

const char * section_path(const entity_kind_t kind)
{
  switch (kind) {
  case INSTITUTIONS: return "KMYMONEY-FILE/INSTITUTIONS";
  case PAYEES:       return "KMYMONEY-FILE/PAYEES";
  case ACCOUNTS:     return "KMYMONEY-FILE/ACCOUNTS";
  case TRANSACTIONS: return "KMYMONEY-FILE/TRANSACTIONS";
  case REPORTS:      return "KMYMONEY-FILE/REPORTS";
  }
  assert(false);
  return NULL;
}

void entity_index_t::build(const xml::document_t& doc)
{
  ids.clear();

  if (! doc.has_descendant(doc.root(), section_path(kind_))) {
    DEBUG("index.build", "No section " << section_path(kind_));
    return;
  }

  foreach (xml::node_id_t node, doc.find_nodes(doc.root(), entity_path(kind_))) {
    const string& id(doc[node].attr("id"));

    std::pair<ids_map::iterator, bool> result =
      ids.insert(ids_map::value_type(id, node));
    if (! result.second) {
      DEBUG("index.build", "Duplicate id '" << id << "' in "
            << entity_path(kind_) << ", keeping the later node");
      (*result.first).second = node;
    }
  }

  DEBUG("index.build", "Indexed " << ids.size() << " entities at "
        << entity_path(kind_));
}

optional<xml::node_id_t> entity_index_t::find(const string& id) const
{
  ids_map::const_iterator i = ids.find(id);
  if (i == ids.end())
    return none;
  return (*i).second;
}

} // namespace kmyjournal
