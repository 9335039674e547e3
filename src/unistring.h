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
 * @addtogroup util
 */

/**
 * @file   unistring.h
 * @author John Wiegley
 *
 * @ingroup util
 */
#ifndef _UNISTRING_H
#define _UNISTRING_H

namespace kmyjournal {

/**
 * @class unistring
 *
 * @brief Abstract working with UTF-32 encoded Unicode strings
 *
 * The input to the string is a UTF-8 encoded kmyjournal::string, which
 * can then have its true length be taken, or characters extracted.
 * Invalid UTF-8 sequences are replaced by U+FFFD on the way in.
 */
class unistring
{
public:
  std::vector<uint32_t> utf32chars;

  unistring() {}
  unistring(const std::string& input)
  {
    if (utf8::is_valid(input.begin(), input.end())) {
      utf8::unchecked::utf8to32(input.begin(), input.end(),
                                std::back_inserter(utf32chars));
    } else {
      std::string valid;
      utf8::replace_invalid(input.begin(), input.end(),
                            std::back_inserter(valid));
      utf8::unchecked::utf8to32(valid.begin(), valid.end(),
                                std::back_inserter(utf32chars));
    }
  }

  std::size_t length() const {
    return utf32chars.size();
  }

  std::string extract(const std::string::size_type begin = 0,
                      const std::string::size_type len   = 0) const
  {
    std::string            utf8result;
    std::string::size_type this_len = length();

    assert(begin <= this_len);
    assert(begin + len <= this_len);

    if (this_len)
      utf8::unchecked::utf32to8
        (utf32chars.begin() + static_cast<std::string::difference_type>(begin),
         utf32chars.begin() + static_cast<std::string::difference_type>(begin) +
         static_cast<std::string::difference_type>
         (len ? (len > this_len ? this_len : len) : this_len),
         std::back_inserter(utf8result));

    return utf8result;
  }

  uint32_t& operator[](const std::size_t index) {
    return utf32chars[index];
  }
  const uint32_t& operator[](const std::size_t index) const {
    return utf32chars[index];
  }
};

/**
 * ISO control characters are U+0000-U+001F and U+007F-U+009F.
 */
inline bool is_iso_control(const uint32_t ch) {
  return ch <= 0x1f || (ch >= 0x7f && ch <= 0x9f);
}

} // namespace kmyjournal

#endif // _UNISTRING_H
