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
 * @defgroup util General utilities
 */

/**
 * @file   utils.h
 * @author John Wiegley
 *
 * @ingroup util
 *
 * @brief General utility facilities used by kmyjournal
 */
#ifndef _UTILS_H
#define _UTILS_H

/**
 * @name Forward declarations
 */
/*@{*/

namespace kmyjournal {
  using namespace boost;

  typedef std::string                 string;
  typedef std::list<string>           strings_list;
  typedef std::vector<string>         strings_vector;

  typedef posix_time::ptime           ptime;
  typedef ptime::time_duration_type   time_duration;

  typedef boost::filesystem::path     path;
  typedef boost::filesystem::ifstream ifstream;
  typedef boost::filesystem::ofstream ofstream;
}

/*@}*/

/**
 * @name Assertions
 */
/*@{*/

#ifdef assert
#undef assert
#endif

#if !NO_ASSERTS

namespace kmyjournal {
  void debug_assert(const string& reason, const string& func,
                    const string& file, std::size_t line);
}

#define assert(x)                                               \
  ((x) ? ((void)0) : kmyjournal::debug_assert(#x, BOOST_CURRENT_FUNCTION, \
                                              __FILE__, __LINE__))

#else // !NO_ASSERTS

#define assert(x) ((void)(x))

#endif // !NO_ASSERTS

/*@}*/

/**
 * @name String helpers
 */
/*@{*/

namespace kmyjournal {

extern string empty_string;

/**
 * True when the string is empty or holds only whitespace; this is the
 * notion of "blank" used throughout text normalization.
 */
inline bool is_blank(const string& str) {
  for (string::const_iterator i = str.begin(); i != str.end(); i++)
    if (! std::isspace(static_cast<unsigned char>(*i)))
      return false;
  return true;
}

} // namespace kmyjournal

/*@}*/

/**
 * @name Tracing and logging
 */
/*@{*/

namespace kmyjournal {

enum log_level_t {
  LOG_OFF = 0,
  LOG_WARN,
  LOG_INFO,
  LOG_DEBUG,
  LOG_TRACE,
  LOG_ALL
};

extern log_level_t        _log_level;
extern std::ostream *     _log_stream;
extern std::ostringstream _log_buffer;

void logger_func(log_level_t level);

#if TRACING_ON

extern uint16_t _trace_level;

#define SHOW_TRACE(lvl) \
  (kmyjournal::_log_level >= kmyjournal::LOG_TRACE && \
   lvl <= kmyjournal::_trace_level)
#define TRACE(lvl, msg) \
  (SHOW_TRACE(lvl) ? \
   ((kmyjournal::_log_buffer << msg), \
    kmyjournal::logger_func(kmyjournal::LOG_TRACE)) : (void)0)

#else // TRACING_ON

#define SHOW_TRACE(lvl) false
#define TRACE(lvl, msg)

#endif // TRACING_ON

#if DEBUG_ON

extern optional<std::string>  _log_category;
#if HAVE_BOOST_REGEX_UNICODE
  extern optional<boost::u32regex> _log_category_re;
#else
  extern optional<boost::regex>    _log_category_re;
#endif

inline bool category_matches(const char * cat) {
  if (_log_category) {
    if (! _log_category_re) {
      _log_category_re =
#if HAVE_BOOST_REGEX_UNICODE
        boost::make_u32regex(_log_category->c_str(),
                             boost::regex::perl | boost::regex::icase);
#else
        boost::regex(_log_category->c_str(),
                     boost::regex::perl | boost::regex::icase);
#endif
    }
#if HAVE_BOOST_REGEX_UNICODE
    return boost::u32regex_search(cat, *_log_category_re);
#else
    return boost::regex_search(cat, *_log_category_re);
#endif
  }
  return false;
}

#define SHOW_DEBUG(cat) \
  (kmyjournal::_log_level >= kmyjournal::LOG_DEBUG && \
   kmyjournal::category_matches(cat))

#define DEBUG(cat, msg) \
  (SHOW_DEBUG(cat) ? \
   ((kmyjournal::_log_buffer << msg), \
    kmyjournal::logger_func(kmyjournal::LOG_DEBUG)) : (void)0)

#else // DEBUG_ON

#define SHOW_DEBUG(cat) false
#define DEBUG(cat, msg)

#endif // DEBUG_ON

#define LOG_MACRO(level, msg) \
  (kmyjournal::_log_level >= level ? \
   ((kmyjournal::_log_buffer << msg), kmyjournal::logger_func(level)) : \
   (void)0)

#define SHOW_INFO() (kmyjournal::_log_level >= kmyjournal::LOG_INFO)

#define INFO(msg) LOG_MACRO(kmyjournal::LOG_INFO, msg)
#define WARN(msg) LOG_MACRO(kmyjournal::LOG_WARN, msg)

} // namespace kmyjournal

/*@}*/

/**
 * @name Timers
 * INFO_START/INFO_FINISH log how long a named step took.
 */
/*@{*/

#if TIMERS_ON

namespace kmyjournal {

void start_timer(const char * name, log_level_t lvl);
void finish_timer(const char * name);

#define INFO_START(name, msg) \
  (SHOW_INFO() ? \
   ((kmyjournal::_log_buffer << msg), \
    kmyjournal::start_timer(#name, kmyjournal::LOG_INFO)) : ((void)0))
#define INFO_FINISH(name) \
  (SHOW_INFO() ? kmyjournal::finish_timer(#name) : ((void)0))

} // namespace kmyjournal

#else // !TIMERS_ON

#define INFO_START(name, msg)
#define INFO_FINISH(name)

#endif // TIMERS_ON

/*@}*/

/*
 * These files define the other internal facilities.
 */

#include "error.h"

/**
 * @name General utility functions
 */
/*@{*/

#define foreach BOOST_FOREACH
using std::unique_ptr;

namespace kmyjournal {

path resolve_path(const path& pathname);

extern const string version;

} // namespace kmyjournal

/*@}*/

#endif // _UTILS_H
