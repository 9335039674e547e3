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

#include "xmlparse.h"
#include "unistring.h"

namespace kmyjournal {
namespace xml {

string strip_control_characters(const string& raw)
{
  unistring chars(raw);

  std::vector<uint32_t> kept;
  kept.reserve(chars.length());
  foreach (uint32_t ch, chars.utf32chars)
    if (! is_iso_control(ch))
      kept.push_back(ch);

  DEBUG("xml.parse", "Stripped " << (chars.length() - kept.size())
        << " control characters");

  string result;
  utf8::unchecked::utf32to8(kept.begin(), kept.end(),
                            std::back_inserter(result));
  return result;
}

namespace {
  void XMLCALL startElement(void * userData, const char * name,
                            const char ** attrs)
  {
    parser_t * parser = static_cast<parser_t *>(userData);

    try {
      node_id_t parent = parser->node_stack.empty() ?
        parser->document->root() : parser->node_stack.back();
      node_id_t id = parser->document->add_node(parent, name);

      if (attrs)
        for (const char ** p = attrs; *p; p += 2)
          parser->document->add_attr(id, *p, *(p + 1));

      TRACE(5, "startElement(" << name << ") -> #" << id);

      parser->node_stack.push_back(id);
    }
    catch (const std::exception& err) {
      parser->have_error = err.what();
      XML_StopParser(parser->parser, XML_FALSE);
    }
  }

  void XMLCALL endElement(void * userData, const char * name)
  {
    parser_t * parser = static_cast<parser_t *>(userData);

    TRACE(5, "endElement(" << name << ")");

    assert(! parser->node_stack.empty());
    parser->node_stack.pop_back();
  }
}

bool parser_t::test(std::istream& in) const
{
  char buf[16];
  std::memset(buf, 0, sizeof(buf));

  in.read(buf, 8);
  const char * p = buf;
  if (std::strncmp(p, "\xEF\xBB\xBF", 3) == 0)
    p += 3;

  const bool is_xml = std::strncmp(p, "<?xml", 5) == 0;

  in.clear();
  in.seekg(0, std::ios::beg);
  return is_xml;
}

unique_ptr<document_t> parser_t::parse(std::istream& in)
{
  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad())
    throw_(parse_error, _("Failed to read XML input"));

  return parse_string(buf.str());
}

unique_ptr<document_t> parser_t::parse_string(const string& text)
{
  unique_ptr<document_t> doc(new document_t);
  document = doc.get();
  node_stack.clear();
  have_error.clear();

  string filtered = strip_control_characters(text);

  parser = XML_ParserCreate("UTF-8");
  if (! parser)
    throw_(parse_error, _("Could not create an XML parser"));

  XML_SetElementHandler(parser, startElement, endElement);
  XML_SetUserData(parser, this);

  const XML_Status result =
    XML_Parse(parser, filtered.c_str(), static_cast<int>(filtered.length()),
              XML_TRUE);

  if (result != XML_STATUS_OK) {
    std::ostringstream msg;
    if (! have_error.empty())
      msg << have_error;
    else
      msg << XML_ErrorString(XML_GetErrorCode(parser))
          << " (column " << XML_GetCurrentColumnNumber(parser) << ")";
    XML_ParserFree(parser);
    parser   = NULL;
    document = NULL;
    throw_(parse_error, msg.str());
  }

  XML_ParserFree(parser);
  parser   = NULL;
  document = NULL;

  DEBUG("xml.parse", "Parsed " << doc->size() << " nodes");

  return doc;
}

unique_ptr<document_t> read_document(const path& pathname)
{
  ifstream in(pathname, std::ios::in | std::ios::binary);
  if (! in)
    throw_(parse_error,
           _f("Cannot read KMyMoney file %1%") % pathname);

  parser_t parser;
  if (! parser.test(in))
    WARN(pathname << " does not start with an XML declaration"
         << " (compressed .kmy files must be unpacked first)");

  return parser.parse(in);
}

} // namespace xml
} // namespace kmyjournal
