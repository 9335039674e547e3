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
 * @file   index.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Lookup tables from KMyMoney ids to document nodes.
 */
#ifndef _INDEX_H
#define _INDEX_H

#include "document.h"

namespace kmyjournal {

enum entity_kind_t {
  INSTITUTIONS,
  PAYEES,
  ACCOUNTS,
  TRANSACTIONS,
  REPORTS
};

/**
 * The path, from the document root, of the nodes of a given kind;
 * e.g. "KMYMONEY-FILE/ACCOUNTS/ACCOUNT".
 */
const char * entity_path(const entity_kind_t kind);

/**
 * The path of the section containing the nodes of a given kind.
 */
const char * section_path(const entity_kind_t kind);

/**
 * @class entity_index_t
 *
 * @brief Maps the "id" attribute of every entity of one kind to its node.
 *
 * The index is built once and never updated.  Should the source carry
 * the same id twice, the later node wins.  A document without the
 * section simply produces an empty index.  Iteration order is by id,
 * not by document order; use document_t::find_nodes() for the latter.
 */
class entity_index_t
{
  typedef std::map<string, xml::node_id_t> ids_map;

  entity_kind_t kind_;
  ids_map       ids;

public:
  typedef ids_map::const_iterator const_iterator;

  explicit entity_index_t(const entity_kind_t _kind) : kind_(_kind) {}
  entity_index_t(const xml::document_t& doc, const entity_kind_t _kind)
    : kind_(_kind) {
    build(doc);
  }

  entity_kind_t kind() const {
    return kind_;
  }

  void build(const xml::document_t& doc);

  optional<xml::node_id_t> find(const string& id) const;

  std::size_t size() const {
    return ids.size();
  }
  bool empty() const {
    return ids.empty();
  }

  const_iterator begin() const {
    return ids.begin();
  }
  const_iterator end() const {
    return ids.end();
  }
};

} // namespace kmyjournal

#endif // _INDEX_H
