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
 * @file   print.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief Writing account declarations and transactions as journal text.
 */
#ifndef _PRINT_H
#define _PRINT_H

#include "account.h"
#include "amount.h"
#include "config.h"

namespace kmyjournal {

/**
 * @class journal_printer_t
 *
 * @brief Emits the body of the journal: one declaration per account and
 * one entry per transaction.
 *
 * Every line is written to the output stream as soon as it is complete.
 * If an amount cannot be evaluated the exception propagates, and
 * whatever was already written stays in the stream.
 */
class journal_printer_t : public noncopyable
{
  std::ostream&          out;
  const xml::document_t& document;
  const entity_index_t&  payees;
  account_resolver_t&    resolver;
  const config_t&        config;

public:
  journal_printer_t(std::ostream&          _out,
                    const xml::document_t& _document,
                    const entity_index_t&  _payees,
                    account_resolver_t&    _resolver,
                    const config_t&        _config)
    : out(_out), document(_document), payees(_payees),
      resolver(_resolver), config(_config) {}

  /**
   * The escaped name of the payee with the given id, or "" if the id
   * does not resolve or the payee has no name.
   */
  string payee_name(const string& payee_id) const;

  void print_account(const xml::node_id_t account);
  void print_transaction(const xml::node_id_t xact);
  void print_posting(const xml::node_id_t split, const string& commodity);
};

} // namespace kmyjournal

#endif // _PRINT_H
