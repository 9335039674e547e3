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
 * @file   option.h
 * @author John Wiegley
 *
 * @ingroup report
 *
 * @brief Command-line and environment option processing.
 *
 * Options live in a table sorted by long name.  Each entry names a
 * handler that receives the config_t being built and the option's
 * argument (or NULL for flags).
 */
#ifndef _OPTION_H
#define _OPTION_H

#include "config.h"

namespace kmyjournal {

DECLARE_EXCEPTION(option_error, std::runtime_error);

typedef void (*handler_t)(config_t& config, const char * optarg);

struct option_t {
  const char * long_opt;
  char         short_opt;
  bool         wants_arg;
  handler_t    handler;
};

#define CONFIG_OPTIONS_SIZE 9
extern option_t config_options[CONFIG_OPTIONS_SIZE];

option_t * search_options(option_t * options, const char * name);
option_t * search_options(option_t * options, const char letter);

/**
 * Apply every option in argv to `config` and collect the remaining
 * arguments in `args`.  Options may appear anywhere; a bare "--" ends
 * option processing.
 */
void process_arguments(option_t * options, config_t& config,
                       int argc, char ** argv, strings_list& args);

/**
 * Apply each `<tag><NAME>=<value>` environment entry as the option
 * `--name value`, with underscores in NAME read as dashes.  A flag is
 * left alone when its value is empty, "0", "false", "no" or "off".
 */
void process_environment(option_t * options, config_t& config,
                         const char ** envp, const string& tag);

void option_usage(std::ostream& out);
void option_help(std::ostream& out);
void show_version(std::ostream& out);

#define OPT_BEGIN(tag)                                          \
  void opt_ ## tag(config_t& config, const char * optarg)

#define OPT_END(tag)

} // namespace kmyjournal

#endif // _OPTION_H
