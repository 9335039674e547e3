#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE index
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "index.h"
#include "xmlparse.h"

using namespace kmyjournal;

struct index_fixture {
  xml::parser_t parser;
};

BOOST_FIXTURE_TEST_SUITE(entity_index, index_fixture)

BOOST_AUTO_TEST_CASE(testEntityPaths)
{
  BOOST_CHECK_EQUAL(string("KMYMONEY-FILE/INSTITUTIONS/INSTITUTION"),
                    entity_path(INSTITUTIONS));
  BOOST_CHECK_EQUAL(string("KMYMONEY-FILE/PAYEES/PAYEE"), entity_path(PAYEES));
  BOOST_CHECK_EQUAL(string("KMYMONEY-FILE/ACCOUNTS/ACCOUNT"),
                    entity_path(ACCOUNTS));
  BOOST_CHECK_EQUAL(string("KMYMONEY-FILE/TRANSACTIONS/TRANSACTION"),
                    entity_path(TRANSACTIONS));
  BOOST_CHECK_EQUAL(string("KMYMONEY-FILE/REPORTS/REPORT"),
                    entity_path(REPORTS));
  BOOST_CHECK_EQUAL(string("KMYMONEY-FILE/REPORTS"), section_path(REPORTS));
}

BOOST_AUTO_TEST_CASE(testBuildIndex)
{
  unique_ptr<xml::document_t> doc(parser.parse_string(
    "<KMYMONEY-FILE>"
    "<PAYEES>"
    "<PAYEE id=\"P1\" name=\"Grocer\"/>"
    "<PAYEE id=\"P2\" name=\"Landlord\"/>"
    "</PAYEES>"
    "</KMYMONEY-FILE>"));

  entity_index_t payees(*doc, PAYEES);
  BOOST_CHECK_EQUAL(PAYEES, payees.kind());
  BOOST_CHECK_EQUAL(2U, payees.size());
  BOOST_CHECK(! payees.empty());

  optional<xml::node_id_t> p2 = payees.find("P2");
  BOOST_CHECK(p2);
  BOOST_CHECK_EQUAL(string("Landlord"), (*doc)[*p2].attr("name"));
  BOOST_CHECK(! payees.find("P3"));
  BOOST_CHECK(! payees.find(""));

  // Every indexed node carries the id it is filed under.
  for (entity_index_t::const_iterator i = payees.begin();
       i != payees.end();
       i++)
    BOOST_CHECK_EQUAL((*i).first, (*doc)[(*i).second].attr("id"));
}

BOOST_AUTO_TEST_CASE(testDuplicateIds)
{
  unique_ptr<xml::document_t> doc(parser.parse_string(
    "<KMYMONEY-FILE><ACCOUNTS>"
    "<ACCOUNT id=\"A1\" name=\"First\"/>"
    "<ACCOUNT id=\"A2\" name=\"Other\"/>"
    "<ACCOUNT id=\"A1\" name=\"Second\"/>"
    "</ACCOUNTS></KMYMONEY-FILE>"));

  entity_index_t accounts(*doc, ACCOUNTS);
  BOOST_CHECK_EQUAL(2U, accounts.size());
  BOOST_CHECK_EQUAL(string("Second"), (*doc)[*accounts.find("A1")].attr("name"));
}

BOOST_AUTO_TEST_CASE(testMissingSection)
{
  unique_ptr<xml::document_t> doc(parser.parse_string(
    "<KMYMONEY-FILE><ACCOUNTS/></KMYMONEY-FILE>"));

  entity_index_t accounts(*doc, ACCOUNTS);
  BOOST_CHECK(accounts.empty());

  entity_index_t reports(*doc, REPORTS);
  BOOST_CHECK(reports.empty());
  BOOST_CHECK(! reports.find("R1"));

  // Only entities directly inside their section are indexed.
  unique_ptr<xml::document_t> nested(parser.parse_string(
    "<KMYMONEY-FILE><TRANSACTIONS><X><TRANSACTION id=\"T1\"/></X>"
    "</TRANSACTIONS></KMYMONEY-FILE>"));
  entity_index_t transactions(*nested, TRANSACTIONS);
  BOOST_CHECK(transactions.empty());
}

BOOST_AUTO_TEST_CASE(testRebuild)
{
  unique_ptr<xml::document_t> first(parser.parse_string(
    "<KMYMONEY-FILE><INSTITUTIONS><INSTITUTION id=\"I1\"/><INSTITUTION id=\"I2\"/>"
    "</INSTITUTIONS></KMYMONEY-FILE>"));
  unique_ptr<xml::document_t> second(parser.parse_string(
    "<KMYMONEY-FILE><INSTITUTIONS><INSTITUTION id=\"I3\"/>"
    "</INSTITUTIONS></KMYMONEY-FILE>"));

  entity_index_t institutions(INSTITUTIONS);
  BOOST_CHECK(institutions.empty());

  institutions.build(*first);
  BOOST_CHECK_EQUAL(2U, institutions.size());

  institutions.build(*second);
  BOOST_CHECK_EQUAL(1U, institutions.size());
  BOOST_CHECK(! institutions.find("I1"));
  BOOST_CHECK(institutions.find("I3"));
}

BOOST_AUTO_TEST_SUITE_END()
