#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE normalize
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "normalize.h"
#include "unistring.h"

using namespace kmyjournal;

struct normalize_fixture {
  normalize_fixture() {
    std::setlocale(LC_CTYPE, "C");
  }
};

BOOST_FIXTURE_TEST_SUITE(normalize, normalize_fixture)

BOOST_AUTO_TEST_CASE(testReplaceNewlines)
{
  BOOST_CHECK_EQUAL(string("a => b"), replace_newlines("a\nb"));
  BOOST_CHECK_EQUAL(string("a / b"), replace_newlines("a\nb", " / "));
  BOOST_CHECK_EQUAL(string("a: b"), replace_newlines("a: b"));
  BOOST_CHECK_EQUAL(string(""), replace_newlines(""));
  BOOST_CHECK_EQUAL(string(""), replace_newlines(" \n\t"));
}

BOOST_AUTO_TEST_CASE(testReplaceSpecialCharacters)
{
  BOOST_CHECK_EQUAL(string("a b c d e f"),
                    replace_special_characters("a:b;c|d[e]f"));
  BOOST_CHECK_EQUAL(string(" x "), replace_special_characters("[x]"));
  BOOST_CHECK_EQUAL(string(""), replace_special_characters("   "));
}

BOOST_AUTO_TEST_CASE(testTrimAndCondense)
{
  BOOST_CHECK_EQUAL(string("a b c"), trim_and_condense("  a   b\t\tc  "));
  BOOST_CHECK_EQUAL(string(""), trim_and_condense("\t \t"));
}

BOOST_AUTO_TEST_CASE(testEscaped)
{
  BOOST_CHECK_EQUAL(string("Checking => Account"),
                    escaped("Checking\nAccount"));
  BOOST_CHECK_EQUAL(string("a b c"), escaped("a:b; c"));
  BOOST_CHECK_EQUAL(string("Gas Station"), escaped("  Gas  [Station] "));
  BOOST_CHECK_EQUAL(string("Keeps Case"), escaped("Keeps Case"));

  // Blank input comes back unchanged.
  BOOST_CHECK_EQUAL(string(""), escaped(""));
  BOOST_CHECK_EQUAL(string("   "), escaped("   "));

  // Non-blank input made only of special characters escapes to nothing.
  BOOST_CHECK_EQUAL(string(""), escaped("::|"));
}

BOOST_AUTO_TEST_CASE(testEscapedContainsNoSpecials)
{
  const char * samples[] = {
    "a:b", "[x]|[y]", " ; leading", "line1\nline2\nline3", "tab\there",
    "many     spaces", "mixed: [all] | of; them\n"
  };

  foreach (const char * sample, samples) {
    string result = escaped(sample);
    BOOST_CHECK_EQUAL(string::npos, result.find_first_of(":;|[]\n"));
    BOOST_CHECK(result.find("  ") == string::npos);
    BOOST_CHECK_EQUAL(result, boost::algorithm::trim_copy(result));
    BOOST_CHECK_EQUAL(result, escaped(result));
  }
}

BOOST_AUTO_TEST_CASE(testFormatted)
{
  BOOST_CHECK_EQUAL(string("asset"), formatted("Asset"));
  BOOST_CHECK_EQUAL(string("liability"), formatted("LIABILITY"));
  BOOST_CHECK_EQUAL(string("equity"), formatted(" Equity "));
  BOOST_CHECK_EQUAL(string("expense"), formatted("Expense"));
  BOOST_CHECK_EQUAL(string("revenue"), formatted("Income"));
  BOOST_CHECK_EQUAL(string("checking account"), formatted("Checking Account"));
  BOOST_CHECK_EQUAL(string("a b"), formatted("A:B"));

  // Only the whole name is mapped to a journal account type.
  BOOST_CHECK_EQUAL(string("income tax"), formatted("Income Tax"));
  BOOST_CHECK_EQUAL(string("assets"), formatted("Assets"));

  BOOST_CHECK_EQUAL(string(""), formatted(""));
  BOOST_CHECK_EQUAL(string(" "), formatted(" "));

  BOOST_CHECK_EQUAL(formatted("Car => Repair"), formatted(formatted("Car\nRepair")));
}

BOOST_AUTO_TEST_CASE(testTopLevelAccount)
{
  BOOST_CHECK_EQUAL(string("revenue"), *top_level_account("income"));
  BOOST_CHECK_EQUAL(string("asset"), *top_level_account("asset"));
  BOOST_CHECK(! top_level_account("Asset"));
  BOOST_CHECK(! top_level_account("revenue"));
  BOOST_CHECK(! top_level_account(""));
}

BOOST_AUTO_TEST_CASE(testCaseMapping)
{
  BOOST_CHECK_EQUAL(string("abc def"), lowered("ABC Def"));
  BOOST_CHECK_EQUAL(string("Revenue"), capitalized("revenue"));
  BOOST_CHECK_EQUAL(string("Asset"), capitalized("aSSET"));
  BOOST_CHECK_EQUAL(string(""), capitalized(""));

  // Case mapping does not depend on the C locale, which is "C" here.
  BOOST_CHECK_EQUAL(string("\xc3\xa9pargne"), lowered("\xc3\x89PARGNE"));
  BOOST_CHECK_EQUAL(string("\xc3\x89pargne"), capitalized("\xc3\xa9PARGNE"));
  BOOST_CHECK_EQUAL(string("\xc3\xa9pargne"), formatted("\xc3\x89pargne"));
  BOOST_CHECK_EQUAL(string("\xc3\xa9pargne \xc3\xa9conomies"),
                    formatted("\xc3\x89PARGNE \xc3\x89CONOMIES"));
  BOOST_CHECK_EQUAL(string("\xd0\xb1\xd0\xb0\xd0\xbd\xd0\xba"),
                    lowered("\xd0\x91\xd0\x90\xd0\x9d\xd0\x9a"));
}

BOOST_AUTO_TEST_CASE(testAttributeLabel)
{
  BOOST_CHECK_EQUAL(string("kmymoney-type"), attribute_label("type"));
  BOOST_CHECK_EQUAL(string("name"), attribute_label("name"));
  BOOST_CHECK_EQUAL(string("Type"), attribute_label("Type"));
}

BOOST_AUTO_TEST_CASE(testJournalDate)
{
  BOOST_CHECK_EQUAL(string("2020/01/31"), to_journal_date("2020-01-31"));
  BOOST_CHECK_EQUAL(string(""), to_journal_date(""));
  BOOST_CHECK_EQUAL(string("garbage"), to_journal_date("garbage"));
  // No validation is done on the fields.
  BOOST_CHECK_EQUAL(string("abcd/ef/gh"), to_journal_date("abcd-ef-gh"));
}

BOOST_AUTO_TEST_CASE(testUnistring)
{
  unistring s("a\xc3\xa9z");
  BOOST_CHECK_EQUAL(3U, s.length());
  BOOST_CHECK_EQUAL(0xe9U, s[1]);
  BOOST_CHECK_EQUAL(string("\xc3\xa9z"), s.extract(1, 2));

  // Invalid sequences become U+FFFD.
  unistring bad("a\xff" "b");
  BOOST_CHECK_EQUAL(3U, bad.length());
  BOOST_CHECK_EQUAL(0xfffdU, bad[1]);

  BOOST_CHECK(is_iso_control(0x00));
  BOOST_CHECK(is_iso_control('\n'));
  BOOST_CHECK(is_iso_control(0x7f));
  BOOST_CHECK(is_iso_control(0x85));
  BOOST_CHECK(! is_iso_control(' '));
  BOOST_CHECK(! is_iso_control(0xa0));
  BOOST_CHECK(! is_iso_control(0xe9));
}

BOOST_AUTO_TEST_SUITE_END()
