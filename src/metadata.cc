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

#include "metadata.h"
#include "normalize.h"

namespace kmyjournal {

void metadata_printer_t::print_attributes(const xml::node_id_t node)
{
  foreach (const xml::attr_pair& attr, document.attributes(node))
    out << "; " << attr.first << ": "
        << replace_newlines(attr.second, config.newline_separator) << '\n';
}

void metadata_printer_t::print_address(const xml::node_id_t node)
{
  if (optional<xml::node_id_t> address = document.find_node(node, "ADDRESS"))
    print_attributes(*address);
}

void metadata_printer_t::print_header(const string& pathname)
{
  out << "; Converted from KMyMoney file: " << pathname << "\n;\n";
}

void metadata_printer_t::print_fileinfo(const xml::node_id_t fileinfo)
{
  out << "; --FILEINFO--\n";

  foreach (xml::node_id_t child, document.children(fileinfo)) {
    out << "; " << document[child].name() << ':';
    foreach (const xml::attr_pair& attr, document.attributes(child))
      out << ' ' << replace_newlines(attr.second, config.newline_separator);
    out << '\n';
  }

  out << ";\n";
}

void metadata_printer_t::print_user(const xml::node_id_t user)
{
  out << "; --USER--\n";
  print_attributes(user);
  print_address(user);
  out << ";\n";
}

void metadata_printer_t::print_account_details
  (const xml::node_id_t accountid, const entity_index_t& accounts)
{
  foreach (const xml::attr_pair& ref, document.attributes(accountid)) {
    optional<xml::node_id_t> account = accounts.find(ref.second);
    if (! account) {
      DEBUG("print.institution",
            "Institution refers to unknown account '" << ref.second << "'");
      continue;
    }

    foreach (const xml::attr_pair& attr, document.attributes(*account)) {
      string value = escaped(attr.second, config.newline_separator);
      if (! is_blank(value))
        out << ";\t" << attribute_label(attr.first) << ": " << value << '\n';
    }
  }
}

void metadata_printer_t::print_institution
  (const xml::node_id_t institution,
   const optional<const entity_index_t&>& accounts)
{
  out << "; --INSTITUTIONS--\n";

  foreach (const xml::attr_pair& attr, document.attributes(institution)) {
    string value = escaped(attr.second, config.newline_separator);
    if (! is_blank(value))
      out << "; " << attribute_label(attr.first) << ": " << value << '\n';
  }

  print_address(institution);

  foreach (xml::node_id_t accountid,
           document.find_nodes(institution, "ACCOUNTIDS/ACCOUNTID")) {
    out << "; accountid: " << document[accountid].attr("id") << '\n';
    if (accounts)
      print_account_details(accountid, *accounts);
  }

  out << ";\n";
}

void metadata_printer_t::print_payee(const xml::node_id_t payee)
{
  out << "; --PAYEE--\n";
  print_attributes(payee);
  print_address(payee);
  out << ";\n";
}

void metadata_printer_t::print_costcenter(const xml::node_id_t costcenter)
{
  out << "; --COSTCENTER--\n";
  print_attributes(costcenter);
  out << ";\n";
}

void metadata_printer_t::print_tag(const xml::node_id_t tag)
{
  out << "; --TAG--\n";
  print_attributes(tag);
  out << ";\n";
}

} // namespace kmyjournal
