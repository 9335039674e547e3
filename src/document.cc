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

#include "document.h"

namespace kmyjournal {
namespace xml {

const node_id_t document_t::root_id;

bool node_t::has_attr(const string& _name) const
{
  return !! get_attr(_name);
}

optional<const string&> node_t::get_attr(const string& _name) const
{
  foreach (const attr_pair& attr, attributes_)
    if (attr.first == _name)
      return attr.second;
  return none;
}

const string& node_t::attr(const string& _name) const
{
  if (optional<const string&> value = get_attr(_name))
    return *value;
  return empty_string;
}

node_id_t document_t::add_node(const node_id_t parent, const string& name)
{
  assert(parent < nodes.size());

  node_id_t id = nodes.size();
  nodes.push_back(node_t(id, parent, name));
  nodes[parent].children_.push_back(id);
  return id;
}

void document_t::add_attr(const node_id_t id, const string& name,
                          const string& value)
{
  assert(id < nodes.size());
  nodes[id].attributes_.push_back(attr_pair(name, value));
}

void document_t::collect(const node_id_t       from,
                         const strings_vector& steps,
                         const std::size_t     depth,
                         node_ids_t&           result,
                         const bool            first_only) const
{
  if (depth == steps.size()) {
    result.push_back(from);
    return;
  }

  const string& step(steps[depth]);
  foreach (node_id_t child, nodes[from].children_) {
    if (step == "*" || nodes[child].name_ == step) {
      collect(child, steps, depth + 1, result, first_only);
      if (first_only && ! result.empty())
        return;
    }
  }
}

namespace {
  strings_vector split_path(const string& path)
  {
    strings_vector steps;
    if (! path.empty())
      boost::algorithm::split(steps, path, boost::algorithm::is_any_of("/"));
    return steps;
  }
}

bool document_t::has_descendant(const node_id_t from,
                                const string&   path) const
{
  return !! find_node(from, path);
}

optional<node_id_t> document_t::find_node(const node_id_t from,
                                          const string&   path) const
{
  assert(from < nodes.size());

  node_ids_t result;
  collect(from, split_path(path), 0, result, true);
  if (result.empty()) {
    DEBUG("xml.find", "No node at '" << path << "' below #" << from);
    return none;
  }
  return result.front();
}

node_ids_t document_t::find_nodes(const node_id_t from,
                                  const string&   path) const
{
  assert(from < nodes.size());

  node_ids_t result;
  collect(from, split_path(path), 0, result, false);
  DEBUG("xml.find", "Found " << result.size() << " nodes at '" << path
        << "' below #" << from);
  return result;
}

} // namespace xml
} // namespace kmyjournal
