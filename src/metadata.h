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
 * @file   metadata.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief The comment header of a converted journal.
 *
 * Data which has no journal equivalent (file information, the owner's
 * address, institutions, payees, cost centers and tags) is preserved as
 * comment blocks at the top of the journal, one "; name: value" line per
 * attribute.  Each block starts with a "; --NAME--" line and ends with a
 * bare ";".
 */
#ifndef _METADATA_H
#define _METADATA_H

#include "index.h"
#include "config.h"

namespace kmyjournal {

class metadata_printer_t : public noncopyable
{
  std::ostream&          out;
  const xml::document_t& document;
  const config_t&        config;

  void print_attributes(const xml::node_id_t node);
  void print_address(const xml::node_id_t node);
  void print_account_details(const xml::node_id_t accountid,
                             const entity_index_t& accounts);

public:
  metadata_printer_t(std::ostream&          _out,
                     const xml::document_t& _document,
                     const config_t&        _config)
    : out(_out), document(_document), config(_config) {}

  void print_header(const string& pathname);
  void print_fileinfo(const xml::node_id_t fileinfo);
  void print_user(const xml::node_id_t user);

  /**
   * Institution attributes, its address and the ids of its accounts.
   * When `accounts` is given, each account id is followed by the
   * attributes of that account.
   */
  void print_institution(const xml::node_id_t institution,
                         const optional<const entity_index_t&>& accounts);

  void print_payee(const xml::node_id_t payee);
  void print_costcenter(const xml::node_id_t costcenter);
  void print_tag(const xml::node_id_t tag);
};

} // namespace kmyjournal

#endif // _METADATA_H
