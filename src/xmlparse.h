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
 * @file   xmlparse.h
 * @author John Wiegley
 *
 * @ingroup data
 *
 * @brief Reading KMyMoney XML into a document_t, using expat.
 */
#ifndef _XMLPARSE_H
#define _XMLPARSE_H

#include "document.h"

namespace kmyjournal {
namespace xml {

DECLARE_EXCEPTION(parse_error, std::runtime_error);

/**
 * Decode `raw` as UTF-8 (invalid sequences become U+FFFD) and drop every
 * ISO control character from it, newlines and tabs included.  KMyMoney
 * files are filtered this way before they are handed to the XML parser,
 * so only characters written as entities, such as "&#10;", survive into
 * attribute values.
 */
string strip_control_characters(const string& raw);

class parser_t : public noncopyable
{
public:
  document_t *           document;
  XML_Parser             parser;
  std::vector<node_id_t> node_stack;
  string                 have_error;

  parser_t() : document(NULL), parser(NULL) {}

  /**
   * True if the stream starts with an XML declaration, after an optional
   * UTF-8 byte order mark.  The stream is rewound either way.
   */
  bool test(std::istream& in) const;

  unique_ptr<document_t> parse(std::istream& in);
  unique_ptr<document_t> parse_string(const string& text);
};

unique_ptr<document_t> read_document(const path& pathname);

} // namespace xml
} // namespace kmyjournal

#endif // _XMLPARSE_H
