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
 * @addtogroup report
 */

/**
 * @file   session.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief The conversion of one KMyMoney document into one journal.
 */
#ifndef _SESSION_H
#define _SESSION_H

#include "index.h"
#include "config.h"

namespace kmyjournal {

class session_t : public noncopyable
{
public:
  const config_t& config;

  unique_ptr<xml::document_t> document;

  entity_index_t institutions;
  entity_index_t payees;
  entity_index_t accounts;
  entity_index_t transactions;
  entity_index_t reports;

  explicit session_t(const config_t& _config)
    : config(_config), institutions(INSTITUTIONS), payees(PAYEES),
      accounts(ACCOUNTS), transactions(TRANSACTIONS), reports(REPORTS) {
    TRACE(1, "session_t::session_t()");
  }

  /**
   * Take ownership of a parsed document and build its indexes.
   */
  void use_document(unique_ptr<xml::document_t> doc);
  void read_document(const path& pathname);

  /**
   * The comment header: the file header line, then (unless metadata is
   * disabled) file info, user, institutions, payees, cost centers and
   * tags, then the blank line that closes the header.
   */
  void print_metadata(std::ostream& out, const path& pathname);

  /**
   * Account declarations, then transactions, both in source order.
   */
  void print_journal(std::ostream& out);

  /**
   * Read `pathname` and write its journal to config.output_path(),
   * truncating any earlier output.  Returns the path written.
   */
  path convert(const path& pathname);
};

/**
 * Print the pending error context and the message of `err` to `err_out`.
 */
void report_error(const std::exception& err, std::ostream& err_out);

/**
 * Convert each of `args` in its own session.  A document that fails is
 * reported and skipped; the rest are still converted.  With no
 * arguments, a usage summary is printed instead.
 *
 * @return 0 when every document converted, 1 otherwise.
 */
int convert_files(const config_t& config, const strings_list& args,
                  std::ostream& out, std::ostream& err_out);

} // namespace kmyjournal

#endif // _SESSION_H
