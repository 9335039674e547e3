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

namespace kmyjournal {

namespace {
  void process_option(option_t * opt, config_t& config,
                      const char * arg = NULL)
  {
    try {
      opt->handler(config, arg);
    }
    catch (const std::exception&) {
      add_error_context(_f("While parsing option '--%1%'%2%")
                        % opt->long_opt
                        % (opt->short_opt != '\0' ?
                           string(" (-") + opt->short_opt + "):" :
                           string(":")));
      throw;
    }
  }

  amount_t::precision_t parse_precision(const char * optarg)
  {
    int places;
    try {
      places = lexical_cast<int>(optarg);
    }
    catch (const bad_lexical_cast&) {
      places = -1;
    }
    if (places < 0 || places > 64)
      throw_(option_error,
             _f("'%1%' is not a number of decimal places") % optarg);
    return static_cast<amount_t::precision_t>(places);
  }

  bool flag_is_set(const char * value)
  {
    string setting(value);
    boost::algorithm::to_lower(setting);
    return ! (setting.empty() || setting == "0" || setting == "false" ||
              setting == "no" || setting == "off");
  }
}

option_t * search_options(option_t * array, const char * name)
{
  int first = 0;
  int last  = CONFIG_OPTIONS_SIZE - 1;
  while (first <= last) {
    int mid = (first + last) / 2; // compute mid point.

    int result;
    if ((result = (int)name[0] - (int)array[mid].long_opt[0]) == 0)
      result = std::strcmp(name, array[mid].long_opt);

    if (result > 0)
      first = mid + 1;          // repeat search in top half.
    else if (result < 0)
      last = mid - 1;           // repeat search in bottom half.
    else
      return &array[mid];
  }
  return NULL;
}

option_t * search_options(option_t * array, const char letter)
{
  for (int i = 0; i < CONFIG_OPTIONS_SIZE; i++)
    if (letter == array[i].short_opt)
      return &array[i];
  return NULL;
}

void process_arguments(option_t * options, config_t& config,
                       int argc, char ** argv, strings_list& args)
{
  for (int i = 0; i < argc; i++) {
    const char * arg = argv[i];

    if (arg[0] != '-' || arg[1] == '\0') {
      args.push_back(arg);
      continue;
    }

    // --long-option or -s
    if (arg[1] == '-') {
      if (arg[2] == '\0') {
        for (i++; i < argc; i++)
          args.push_back(argv[i]);
        break;
      }

      string      name(arg + 2);
      const char * value = NULL;
      string       inline_value;

      string::size_type eq = name.find('=');
      if (eq != string::npos) {
        inline_value = name.substr(eq + 1);
        name.erase(eq);
        value = inline_value.c_str();
      }

      option_t * opt = search_options(options, name.c_str());
      if (! opt)
        throw_(option_error, _f("Illegal option --%1%") % name);

      if (opt->wants_arg && value == NULL) {
        if (++i == argc)
          throw_(option_error,
                 _f("Missing option argument for --%1%") % name);
        value = argv[i];
      }
      else if (! opt->wants_arg && value != NULL) {
        throw_(option_error,
               _f("Option --%1% does not accept an argument") % name);
      }
      process_option(opt, config, value);
    }
    else {
      std::list<option_t *> opt_queue;

      for (const char * c = arg + 1; *c != '\0'; c++) {
        option_t * opt = search_options(options, *c);
        if (! opt)
          throw_(option_error, _f("Illegal option -%1%") % *c);
        opt_queue.push_back(opt);
      }

      foreach (option_t * opt, opt_queue) {
        const char * value = NULL;
        if (opt->wants_arg) {
          if (++i == argc)
            throw_(option_error,
                   _f("Missing option argument for -%1%") % opt->short_opt);
          value = argv[i];
        }
        process_option(opt, config, value);
      }
    }
  }
}

void process_environment(option_t * options, config_t& config,
                         const char ** envp, const string& tag)
{
  const char *      tag_p   = tag.c_str();
  string::size_type tag_len = tag.length();

  for (const char ** p = envp; *p; p++) {
    if (std::strncmp(*p, tag_p, tag_len) != 0)
      continue;

    string       name;
    const char * q;
    for (q = *p + tag_len; *q && *q != '='; q++)
      if (*q == '_')
        name += '-';
      else
        name += static_cast<char>(std::tolower(static_cast<unsigned char>(*q)));

    if (*q != '=')
      continue;

    option_t * opt = search_options(options, name.c_str());
    if (! opt) {
      DEBUG("option.env", "Ignoring environment variable " << *p);
      continue;
    }

    if (! opt->wants_arg && ! flag_is_set(q + 1)) {
      DEBUG("option.env", "Flag left off by " << *p);
      continue;
    }

    try {
      process_option(opt, config, opt->wants_arg ? q + 1 : NULL);
    }
    catch (const std::exception&) {
      add_error_context(_f("While parsing environment variable '%1%':") % *p);
      throw;
    }
  }
}

void option_usage(std::ostream& out)
{
  out << _("Usage: kmyjournal [options] pathname [pathname ...]\n");
}

void option_help(std::ostream& out)
{
  option_usage(out);
  out << _("\n\
Converts each KMyMoney XML file into an hledger journal written beside\n\
it, at <pathname>.journal.  Compressed .kmy files must be unpacked\n\
first (gunzip -c file.kmy > file.xml).\n\
\n\
Options:\n\
  -h, --help                 display this help text\n\
  -v, --version              show version information\n\
      --newline-separator S  replace newlines in comments with S (\" => \")\n\
      --suffix S             append S to each output path (.journal)\n\
      --precision N          print amounts with at least N places (2)\n\
      --max-precision N      round amounts beyond N places (8)\n\
      --no-metadata          omit the file metadata comment blocks\n\
      --verbose              report progress and timings\n\
      --debug CATEGORY       show debug messages matching CATEGORY\n\
\n\
Every option may also be given in the environment as KMYJOURNAL_<NAME>,\n\
for example KMYJOURNAL_NEWLINE_SEPARATOR.\n");
}

void show_version(std::ostream& out)
{
  out << "kmyjournal " << version
      << _(", converts KMyMoney files to hledger journals") << "\n\n"
      << _("This program is made available under the terms of the BSD Public License.\n\
See LICENSE file included with the distribution for details and disclaimer.\n");
  out << "\n(modules: gmp, expat, utf8cpp, boost " << BOOST_LIB_VERSION
      << ")\n";
}

//////////////////////////////////////////////////////////////////////

OPT_BEGIN(debug) {
  config.debug_category = string(optarg);
} OPT_END(debug);

OPT_BEGIN(help) {
  option_help(std::cout);
  throw error_count(0, "");
} OPT_END(help);

OPT_BEGIN(max_precision) {
  config.max_precision = parse_precision(optarg);
} OPT_END(max_precision);

OPT_BEGIN(newline_separator) {
  config.newline_separator = optarg;
} OPT_END(newline_separator);

OPT_BEGIN(no_metadata) {
  config.metadata = false;
} OPT_END(no_metadata);

OPT_BEGIN(precision) {
  config.precision = parse_precision(optarg);
} OPT_END(precision);

OPT_BEGIN(suffix) {
  if (*optarg == '\0')
    throw_(option_error, _("The output suffix may not be empty"));
  config.suffix = optarg;
} OPT_END(suffix);

OPT_BEGIN(verbose) {
  config.verbose_mode = true;
} OPT_END(verbose);

OPT_BEGIN(version) {
  show_version(std::cout);
  throw error_count(0, "");
} OPT_END(version);

option_t config_options[CONFIG_OPTIONS_SIZE] = {
  { "debug",             '\0', true,  opt_debug },
  { "help",              'h',  false, opt_help },
  { "max-precision",     '\0', true,  opt_max_precision },
  { "newline-separator", '\0', true,  opt_newline_separator },
  { "no-metadata",       '\0', false, opt_no_metadata },
  { "precision",         '\0', true,  opt_precision },
  { "suffix",            '\0', true,  opt_suffix },
  { "verbose",           '\0', false, opt_verbose },
  { "version",           'v',  false, opt_version },
};

} // namespace kmyjournal
