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

#include "option.h"
#include "session.h"

using namespace kmyjournal;

namespace {
  void handle_debug_options(const config_t& config)
  {
    if (config.verbose_mode && _log_level < LOG_INFO)
      _log_level = LOG_INFO;

#if DEBUG_ON
    if (config.debug_category) {
      _log_level    = LOG_DEBUG;
      _log_category = *config.debug_category;
      _log_category_re = none;
    }
#endif
  }
}

int main(int argc, char * argv[], char * envp[])
{
#if HAVE_GETTEXT
  ::textdomain("kmyjournal");
#endif

  config_t     config;
  strings_list args;

  try {
    process_environment(config_options, config,
                        const_cast<const char **>(envp), "KMYJOURNAL_");
    process_arguments(config_options, config, argc - 1, argv + 1, args);
  }
  catch (const std::exception& err) {
    report_error(err, std::cerr);
    option_usage(std::cerr);
    return 1;
  }
  catch (const error_count& errors) {
    // used for a "quick" exit, after --help or --version was displayed
    return static_cast<int>(errors.count);
  }

  handle_debug_options(config);

  INFO("kmyjournal starting");

  int status = convert_files(config, args, std::cout, std::cerr);

  INFO("kmyjournal ended");

  return status;
}

// main.cc ends here.
