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

#include "session.h"
#include "xmlparse.h"
#include "account.h"
#include "metadata.h"
#include "print.h"
#include "option.h"

namespace kmyjournal {

void session_t::use_document(unique_ptr<xml::document_t> doc)
{
  document = std::move(doc);

  institutions.build(*document);
  payees.build(*document);
  accounts.build(*document);
  transactions.build(*document);
  reports.build(*document);

  INFO("Indexed " << institutions.size() << " institutions, "
       << payees.size() << " payees, " << accounts.size() << " accounts, "
       << transactions.size() << " transactions and "
       << reports.size() << " reports");
}

void session_t::read_document(const path& pathname)
{
  INFO_START(parsing, "Parsed " << pathname);
  use_document(xml::read_document(pathname));
  INFO_FINISH(parsing);
}

void session_t::print_metadata(std::ostream& out, const path& pathname)
{
  assert(document);

  const xml::document_t& doc(*document);
  metadata_printer_t     printer(out, doc, config);

  printer.print_header(pathname.string());

  if (config.metadata) {
    const xml::node_id_t root = doc.root();

    if (optional<xml::node_id_t> fileinfo =
        doc.find_node(root, "KMYMONEY-FILE/FILEINFO"))
      printer.print_fileinfo(*fileinfo);

    if (optional<xml::node_id_t> user =
        doc.find_node(root, "KMYMONEY-FILE/USER"))
      printer.print_user(*user);

    optional<const entity_index_t&> accounts_index;
    if (doc.has_descendant(root, section_path(ACCOUNTS)))
      accounts_index = optional<const entity_index_t&>(accounts);

    foreach (xml::node_id_t institution,
             doc.find_nodes(root, entity_path(INSTITUTIONS)))
      printer.print_institution(institution, accounts_index);

    foreach (xml::node_id_t payee, doc.find_nodes(root, entity_path(PAYEES)))
      printer.print_payee(payee);

    foreach (xml::node_id_t costcenter,
             doc.find_nodes(root, "KMYMONEY-FILE/COSTCENTERS/COSTCENTER"))
      printer.print_costcenter(costcenter);

    foreach (xml::node_id_t tag, doc.find_nodes(root, "KMYMONEY-FILE/TAGS/TAG"))
      printer.print_tag(tag);
  }

  // End the comment header.
  out << '\n';
}

void session_t::print_journal(std::ostream& out)
{
  assert(document);

  const xml::document_t& doc(*document);
  account_resolver_t     resolver(doc, accounts, config.newline_separator);
  journal_printer_t      printer(out, doc, payees, resolver, config);

  foreach (xml::node_id_t account,
           doc.find_nodes(doc.root(), entity_path(ACCOUNTS)))
    printer.print_account(account);

  foreach (xml::node_id_t xact,
           doc.find_nodes(doc.root(), entity_path(TRANSACTIONS)))
    printer.print_transaction(xact);
}

path session_t::convert(const path& pathname)
{
  INFO_START(convert, "Converted " << pathname);

  read_document(pathname);

  path target = config.output_path(pathname);

  ofstream out(target, std::ios::out | std::ios::trunc);
  if (! out)
    throw_(std::runtime_error,
           _f("Cannot write journal file %1%") % target);

  try {
    print_metadata(out, pathname);
    print_journal(out);
  }
  catch (const std::exception&) {
    add_error_context(_f("While writing journal file %1%") % target);
    throw;
  }

  out.close();
  if (out.fail())
    throw_(std::runtime_error,
           _f("Error writing journal file %1%") % target);

  INFO_FINISH(convert);

  return target;
}

void report_error(const std::exception& err, std::ostream& err_out)
{
  string context = error_context();
  if (! context.empty())
    err_out << context << std::endl;

  err_out << _("Error: ") << err.what() << std::endl;
}

int convert_files(const config_t& config, const strings_list& args,
                  std::ostream& out, std::ostream& err_out)
{
  if (args.empty()) {
    option_usage(out);
    out << '\n'
        << _f("Converts KMyMoney file format to HLedger. Output files "
              "are postfixed with a %1% file extension.") % config.suffix
        << std::endl;
    return 0;
  }

  int status = 0;

  foreach (const string& arg, args) {
    out << arg << " ..." << std::flush;
    try {
      session_t session(config);
      session.convert(resolve_path(arg));
      out << " done." << std::endl;
    }
    catch (const std::exception& err) {
      out << std::endl;         // first finish the progress line
      report_error(err, err_out);
      status = 1;
    }
  }

  return status;
}

} // namespace kmyjournal
