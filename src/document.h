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
 * @file   document.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief A read-only XML element tree kept in an arena.
 *
 * Every element of a parsed document is stored by value inside the
 * document_t that owns it and is addressed by its index, a node_id_t.
 * Parent, child and attribute lookups are therefore plain vector
 * accesses, and no node is ever copied or shared outside its document.
 */
#ifndef _DOCUMENT_H
#define _DOCUMENT_H

#include "utils.h"

namespace kmyjournal {
namespace xml {

typedef std::size_t node_id_t;

typedef std::pair<string, string>    attr_pair;
typedef std::vector<attr_pair>       attributes_t;
typedef std::vector<node_id_t>       node_ids_t;

class document_t;

/**
 * @class node_t
 *
 * @brief One element: its tag name, its attributes in document order
 * and the ids of its child elements in document order.
 */
class node_t
{
  friend class document_t;

  node_id_t    id_;
  node_id_t    parent_;
  string       name_;
  attributes_t attributes_;
  node_ids_t   children_;

public:
  node_t(const node_id_t _id, const node_id_t _parent, const string& _name)
    : id_(_id), parent_(_parent), name_(_name) {}

  node_id_t id() const {
    return id_;
  }
  node_id_t parent() const {
    return parent_;
  }
  const string& name() const {
    return name_;
  }
  const attributes_t& attributes() const {
    return attributes_;
  }
  const node_ids_t& children() const {
    return children_;
  }

  bool has_attr(const string& _name) const;
  optional<const string&> get_attr(const string& _name) const;

  /**
   * The attribute's value, or "" when the attribute is absent.
   */
  const string& attr(const string& _name) const;
};

/**
 * @class document_t
 *
 * @brief Owner of all nodes of one parsed XML document.
 *
 * Node 0 is a synthetic root with an empty name; the document element
 * (KMYMONEY-FILE for KMyMoney files) is its only child.  Paths used by
 * the query functions are element names separated by '/', relative to
 * the node the query starts from, where '*' matches any name.  So
 * find_nodes(root(), "KMYMONEY-FILE/ACCOUNTS/ACCOUNT") yields every
 * account, in document order.
 */
class document_t : public noncopyable
{
  std::vector<node_t> nodes;

  void collect(const node_id_t               from,
               const strings_vector&         steps,
               const std::size_t             depth,
               node_ids_t&                   result,
               const bool                    first_only) const;

public:
  static const node_id_t root_id = 0;

  document_t() {
    nodes.push_back(node_t(root_id, root_id, ""));
  }

  node_id_t root() const {
    return root_id;
  }
  std::size_t size() const {
    return nodes.size();
  }

  const node_t& node(const node_id_t id) const {
    assert(id < nodes.size());
    return nodes[id];
  }
  const node_t& operator[](const node_id_t id) const {
    return node(id);
  }

  node_id_t add_node(const node_id_t parent, const string& name);
  void      add_attr(const node_id_t id, const string& name,
                     const string& value);

  bool                has_descendant(const node_id_t from,
                                     const string&   path) const;
  optional<node_id_t> find_node(const node_id_t from,
                                const string&   path) const;
  node_ids_t          find_nodes(const node_id_t from,
                                 const string&   path) const;

  const attributes_t& attributes(const node_id_t id) const {
    return node(id).attributes();
  }
  const node_ids_t& children(const node_id_t id) const {
    return node(id).children();
  }
};

} // namespace xml
} // namespace kmyjournal

#endif // _DOCUMENT_H
