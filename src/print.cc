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

#include "print.h"

namespace kmyjournal {

namespace {
  const char * const account_postfix = "  ";
  const char * const posting_prefix  = "  ";
  const char * const posting_postfix = "  ";
  const char * const payee_separator = " | ";
}

string journal_printer_t::payee_name(const string& payee_id) const
{
  optional<xml::node_id_t> payee = payees.find(payee_id);
  if (! payee) {
    if (! payee_id.empty())
      DEBUG("print.payee", "Unknown payee '" << payee_id << "'");
    return empty_string;
  }
  return escaped(document[*payee].attr("name"), config.newline_separator);
}

void journal_printer_t::print_account(const xml::node_id_t account)
{
  const xml::node_t& node(document[account]);

  DEBUG("print.account", "Declaring account '" << node.attr("id") << "'");

  out << "account " << resolver.path(account, DECLARATION_PATH)
      << account_postfix << "; " << resolver.path(account, COMMENT_PATH)
      << '\n';

  if (is_blank(node.attr("parentaccount")))
    if (optional<const string&> name = node.get_attr("name"))
      out << "  ; type: "
          << capitalized(formatted(*name, config.newline_separator)) << '\n';

  foreach (const xml::attr_pair& attr, node.attributes()) {
    string value = escaped(attr.second, config.newline_separator);
    if (! is_blank(value))
      out << "  ; " << attribute_label(attr.first) << ": " << value << '\n';
  }

  out << '\n';
}

void journal_printer_t::print_posting(const xml::node_id_t split,
                                      const string&        commodity)
{
  const xml::node_t& node(document[split]);

  string account;
  if (optional<string> name =
      resolver.path_of(node.attr("account"), DECLARATION_PATH)) {
    account = *name;
  } else {
    WARN("Split '" << node.attr("id") << "' refers to unknown account '"
         << node.attr("account") << "'");
  }

  string amount;
  try {
    amount = evaluate_fraction(node.attr("value"), config.precision,
                               config.max_precision);
  }
  catch (const std::exception&) {
    add_error_context(_f("While evaluating the value of split '%1%'")
                      % node.attr("id"));
    throw;
  }

  string payee;
  if (optional<const string&> payee_id = node.get_attr("payee"))
    payee = payee_name(*payee_id);

  string memo;
  if (optional<const string&> text = node.get_attr("memo"))
    memo = escaped(*text, config.newline_separator);

  out << posting_prefix << account << posting_postfix << commodity
      << ' ' << amount << " ; " << payee << payee_separator << memo << '\n';
}

void journal_printer_t::print_transaction(const xml::node_id_t xact)
{
  const xml::node_t& node(document[xact]);

  out << '\n';

  xml::node_ids_t splits = document.find_nodes(xact, "SPLITS/SPLIT");
  if (splits.empty()) {
    DEBUG("print.xact", "Transaction '" << node.attr("id")
          << "' has no splits");
    return;
  }

  // The entry's payee and note come from its first split only.
  const xml::node_t& first(document[splits.front()]);
  string payee = payee_name(first.attr("payee"));
  string memo  = escaped(first.attr("memo"), config.newline_separator);

  const string& commodity(node.attr("commodity"));

  out << to_journal_date(node.attr("postdate"))
      << " (" << node.attr("id") << ") " << payee
      << payee_separator << memo << '\n';

  try {
    foreach (xml::node_id_t split, splits)
      print_posting(split, commodity);
  }
  catch (const std::exception&) {
    add_error_context(_f("While printing transaction '%1%'")
                      % node.attr("id"));
    throw;
  }
}

} // namespace kmyjournal
