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

#include "utils.h"

#define TRUE_CURRENT_TIME() (boost::posix_time::microsec_clock::local_time())

/**********************************************************************
 *
 * Assertions
 */

#if !NO_ASSERTS

namespace kmyjournal {

DECLARE_EXCEPTION(assertion_failed, std::logic_error);

void debug_assert(const string& reason,
                  const string& func,
                  const string& file,
                  std::size_t   line)
{
  std::ostringstream buf;
  buf << "Assertion failed in " << file_context(file, line)
      << func << ": " << reason;
  throw assertion_failed(buf.str());
}

} // namespace kmyjournal

#endif

/**********************************************************************
 *
 * Logging
 */

namespace kmyjournal {

log_level_t        _log_level  = LOG_WARN;
std::ostream *     _log_stream = &std::cerr;
std::ostringstream _log_buffer;

#if TRACING_ON
uint16_t           _trace_level;
#endif

static bool  logger_has_run = false;
static ptime logger_start;

void logger_func(log_level_t level)
{
  if (! logger_has_run) {
    logger_has_run = true;
    logger_start   = TRUE_CURRENT_TIME();
  }

  *_log_stream << std::right << std::setw(5)
               << (TRUE_CURRENT_TIME() -
                   logger_start).total_milliseconds() << "ms";

  *_log_stream << "  " << std::left << std::setw(7);

  switch (level) {
  case LOG_WARN:  *_log_stream << "[WARN]"; break;
  case LOG_INFO:  *_log_stream << "[INFO]"; break;
  case LOG_DEBUG: *_log_stream << "[DEBUG]"; break;
  case LOG_TRACE: *_log_stream << "[TRACE]"; break;

  case LOG_OFF:
  case LOG_ALL:
    assert(false);
    break;
  }

  *_log_stream << ' ' << _log_buffer.str() << std::endl;
  _log_buffer.clear();
  _log_buffer.str("");
}

} // namespace kmyjournal

#if DEBUG_ON

namespace kmyjournal {

optional<std::string>     _log_category;
#if HAVE_BOOST_REGEX_UNICODE
optional<boost::u32regex> _log_category_re;
#else
optional<boost::regex>    _log_category_re;
#endif

static struct __maybe_enable_debugging {
  __maybe_enable_debugging() {
    if (const char * p = std::getenv("KMYJOURNAL_DEBUG")) {
      _log_level    = LOG_DEBUG;
      _log_category = p;
    }
  }
} __maybe_enable_debugging_obj;

} // namespace kmyjournal

#endif // DEBUG_ON

/**********************************************************************
 *
 * Timers (allows log entries to specify cumulative time spent)
 */

#if TIMERS_ON

namespace kmyjournal {

struct timer_t
{
  log_level_t level;
  ptime       begin;
  std::string description;

  timer_t(log_level_t _level, std::string _description)
    : level(_level), begin(TRUE_CURRENT_TIME()),
      description(_description) {}
};

typedef std::map<std::string, timer_t> timer_map;

static timer_map timers;

void start_timer(const char * name, log_level_t lvl)
{
  timer_map::iterator i = timers.find(name);
  if (i == timers.end()) {
    timers.insert(timer_map::value_type(name, timer_t(lvl, _log_buffer.str())));
  } else {
    (*i).second.description = _log_buffer.str();
    (*i).second.begin       = TRUE_CURRENT_TIME();
  }
  _log_buffer.clear();
  _log_buffer.str("");
}

void finish_timer(const char * name)
{
  timer_map::iterator i = timers.find(name);
  if (i == timers.end())
    return;

  time_duration spent = TRUE_CURRENT_TIME() - (*i).second.begin;
  const string& desc((*i).second.description);

  // "Converting foo:" reads as a label; anything else gets parentheses
  _log_buffer << desc << ' ';
  if (desc.empty() || desc[desc.size() - 1] != ':')
    _log_buffer << '(' << spent.total_milliseconds() << "ms)";
  else
    _log_buffer << spent.total_milliseconds() << "ms";

  logger_func((*i).second.level);

  timers.erase(i);
}

} // namespace kmyjournal

#endif // TIMERS_ON

/**********************************************************************
 *
 * General utility functions
 */

namespace kmyjournal {

string empty_string("");

const string version(KMYJOURNAL_VERSION);

namespace {
  path expand_path(const path& pathname)
  {
    if (pathname.empty())
      return pathname;

    std::string       path_string = pathname.string();
    const char *      pfx = NULL;
    string::size_type pos = path_string.find_first_of('/');

    // Only "~" and "~/..." are expanded; "~user" is left alone.
    if (path_string.length() == 1 || pos == 1)
      pfx = std::getenv("HOME");

    // if we failed to find an expansion, return the path unchanged.

    if (! pfx)
      return pathname;

    string result(pfx);

    if (pos == string::npos)
      return result;

    if (result.length() == 0 || result[result.length() - 1] != '/')
      result += '/';

    result += path_string.substr(pos + 1);

    return result;
  }
}

path resolve_path(const path& pathname)
{
  path temp = pathname;
  if (! temp.empty() && temp.string()[0] == '~')
    temp = expand_path(temp);
  return temp;
}

} // namespace kmyjournal
