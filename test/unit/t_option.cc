#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE option
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "option.h"

using namespace kmyjournal;

struct option_fixture {
  config_t     config;
  strings_list args;

  option_fixture() {
    clear_error_context();
  }

  ~option_fixture() {
    clear_error_context();
  }

  void process(const char * first,        const char * second = NULL,
               const char * third = NULL, const char * fourth = NULL,
               const char * fifth = NULL) {
    const char * argv[] = { first, second, third, fourth, fifth, NULL };
    int argc = 0;
    while (argv[argc])
      argc++;
    process_arguments(config_options, config, argc,
                      const_cast<char **>(argv), args);
  }
};

BOOST_FIXTURE_TEST_SUITE(options, option_fixture)

BOOST_AUTO_TEST_CASE(testDefaults)
{
  BOOST_CHECK_EQUAL(string(" => "), config.newline_separator);
  BOOST_CHECK_EQUAL(string(".journal"), config.suffix);
  BOOST_CHECK_EQUAL(amount_t::precision_t(2), config.precision);
  BOOST_CHECK_EQUAL(amount_t::precision_t(8), config.max_precision);
  BOOST_CHECK(config.metadata);
  BOOST_CHECK(! config.verbose_mode);
  BOOST_CHECK(! config.debug_category);

  BOOST_CHECK_EQUAL(string("money.xml.journal"),
                    config.output_path("money.xml").string());
}

BOOST_AUTO_TEST_CASE(testOptionTableIsSorted)
{
  for (int i = 1; i < CONFIG_OPTIONS_SIZE; i++)
    BOOST_CHECK(std::strcmp(config_options[i - 1].long_opt,
                            config_options[i].long_opt) < 0);

  for (int i = 0; i < CONFIG_OPTIONS_SIZE; i++)
    BOOST_CHECK_EQUAL(&config_options[i],
                      search_options(config_options,
                                     config_options[i].long_opt));

  BOOST_CHECK(search_options(config_options, "unknown") == NULL);
  BOOST_CHECK(search_options(config_options, 'h') ==
              search_options(config_options, "help"));
  BOOST_CHECK(search_options(config_options, 'x') == NULL);
}

BOOST_AUTO_TEST_CASE(testLongOptions)
{
  process("--newline-separator", " / ", "a.xml", "--suffix=.ledger", "b.xml");

  BOOST_CHECK_EQUAL(string(" / "), config.newline_separator);
  BOOST_CHECK_EQUAL(string(".ledger"), config.suffix);
  BOOST_CHECK_EQUAL(2U, args.size());
  BOOST_CHECK_EQUAL(string("a.xml"), args.front());
  BOOST_CHECK_EQUAL(string("b.xml"), args.back());
}

BOOST_AUTO_TEST_CASE(testFlagsAndNumbers)
{
  process("--no-metadata", "--verbose", "--precision", "3",
          "--max-precision=10");

  BOOST_CHECK(! config.metadata);
  BOOST_CHECK(config.verbose_mode);
  BOOST_CHECK_EQUAL(amount_t::precision_t(3), config.precision);
  BOOST_CHECK_EQUAL(amount_t::precision_t(10), config.max_precision);
  BOOST_CHECK(args.empty());
}

BOOST_AUTO_TEST_CASE(testEndOfOptions)
{
  process("--debug", "print", "--", "--verbose", "-");

  BOOST_CHECK_EQUAL(string("print"), *config.debug_category);
  BOOST_CHECK(! config.verbose_mode);
  BOOST_CHECK_EQUAL(2U, args.size());
  BOOST_CHECK_EQUAL(string("--verbose"), args.front());
  BOOST_CHECK_EQUAL(string("-"), args.back());
}

BOOST_AUTO_TEST_CASE(testBadOptions)
{
  BOOST_CHECK_THROW(process("--bogus"), option_error);
  BOOST_CHECK_THROW(process("-x"), option_error);
  BOOST_CHECK_THROW(process("--suffix"), option_error);
  BOOST_CHECK_THROW(process("--verbose=yes"), option_error);
  BOOST_CHECK_THROW(process("--suffix", ""), option_error);
  BOOST_CHECK_THROW(process("--precision", "two"), option_error);
  BOOST_CHECK_THROW(process("--precision", "-1"), option_error);
  BOOST_CHECK_THROW(process("--max-precision", "1000"), option_error);
}

BOOST_AUTO_TEST_CASE(testOptionErrorContext)
{
  BOOST_CHECK_THROW(process("--precision", "two"), option_error);
  BOOST_CHECK_EQUAL(string("While parsing option '--precision':"),
                    error_context());
}

BOOST_AUTO_TEST_CASE(testHelpAndVersion)
{
  std::ostringstream help;
  option_help(help);
  BOOST_CHECK(help.str().find("Usage: kmyjournal") == 0);
  BOOST_CHECK(help.str().find("--newline-separator") != string::npos);

  std::ostringstream ver;
  show_version(ver);
  BOOST_CHECK(ver.str().find(string("kmyjournal ") + version) == 0);
}

BOOST_AUTO_TEST_CASE(testEnvironment)
{
  const char * envp[] = {
    "HOME=/home/jane",
    "KMYJOURNAL_NEWLINE_SEPARATOR= ~ ",
    "KMYJOURNAL_NO_METADATA=1",
    "KMYJOURNAL_MAX_PRECISION=4",
    "KMYJOURNAL_VERBOSE=",
    "KMYJOURNAL_UNKNOWN_SETTING=1",
    NULL
  };
  process_environment(config_options, config, envp, "KMYJOURNAL_");

  BOOST_CHECK_EQUAL(string(" ~ "), config.newline_separator);
  BOOST_CHECK(! config.metadata);
  BOOST_CHECK_EQUAL(amount_t::precision_t(4), config.max_precision);
  BOOST_CHECK(! config.verbose_mode);

  // The command line is processed afterwards and wins.
  process("--max-precision", "6");
  BOOST_CHECK_EQUAL(amount_t::precision_t(6), config.max_precision);
}

BOOST_AUTO_TEST_CASE(testEnvironmentFlagValues)
{
  const char * off[] = {
    "KMYJOURNAL_NO_METADATA=0",
    "KMYJOURNAL_VERBOSE=false",
    NULL
  };
  process_environment(config_options, config, off, "KMYJOURNAL_");
  BOOST_CHECK(config.metadata);
  BOOST_CHECK(! config.verbose_mode);

  const char * also_off[] = {
    "KMYJOURNAL_NO_METADATA=Off",
    "KMYJOURNAL_VERBOSE=no",
    NULL
  };
  process_environment(config_options, config, also_off, "KMYJOURNAL_");
  BOOST_CHECK(config.metadata);
  BOOST_CHECK(! config.verbose_mode);

  const char * on[] = {
    "KMYJOURNAL_NO_METADATA=true",
    "KMYJOURNAL_VERBOSE=yes",
    NULL
  };
  process_environment(config_options, config, on, "KMYJOURNAL_");
  BOOST_CHECK(! config.metadata);
  BOOST_CHECK(config.verbose_mode);
}

BOOST_AUTO_TEST_CASE(testEnvironmentErrors)
{
  const char * envp[] = { "KMYJOURNAL_PRECISION=lots", NULL };
  BOOST_CHECK_THROW(process_environment(config_options, config, envp,
                                        "KMYJOURNAL_"), option_error);
  string context = error_context();
  BOOST_CHECK(context.find("KMYJOURNAL_PRECISION=lots") != string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
