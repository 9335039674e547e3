#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE document
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "document.h"
#include "xmlparse.h"

using namespace kmyjournal;
using namespace kmyjournal::xml;

namespace {
  const char * const sample_file =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
    "<!DOCTYPE KMYMONEY-FILE>"
    "<KMYMONEY-FILE>"
    "<FILEINFO><VERSION id=\"1\"/><FIXVERSION id=\"5\"/></FILEINFO>"
    "<USER name=\"Jane\" email=\"jane@example.org\">"
    "<ADDRESS street=\"Main St 1\" city=\"Springfield\"/>"
    "</USER>"
    "<ACCOUNTS>"
    "<ACCOUNT id=\"A1\" name=\"Asset\" type=\"9\"/>"
    "<ACCOUNT id=\"A2\" name=\"Checking\" parentaccount=\"A1\"/>"
    "</ACCOUNTS>"
    "<TRANSACTIONS>"
    "<TRANSACTION id=\"T1\"><SPLITS><SPLIT id=\"S1\"/><SPLIT id=\"S2\"/></SPLITS></TRANSACTION>"
    "<TRANSACTION id=\"T2\"><SPLITS/></TRANSACTION>"
    "</TRANSACTIONS>"
    "</KMYMONEY-FILE>";
}

struct document_fixture {
  parser_t               parser;
  unique_ptr<document_t> doc;

  document_fixture() : doc(parser.parse_string(sample_file)) {}
};

BOOST_FIXTURE_TEST_SUITE(document, document_fixture)

BOOST_AUTO_TEST_CASE(testBuildTree)
{
  document_t tree;
  BOOST_CHECK_EQUAL(1U, tree.size());
  BOOST_CHECK_EQUAL(string(""), tree[tree.root()].name());

  node_id_t file = tree.add_node(tree.root(), "KMYMONEY-FILE");
  node_id_t info = tree.add_node(file, "FILEINFO");
  tree.add_attr(info, "b", "2");
  tree.add_attr(info, "a", "1");

  BOOST_CHECK_EQUAL(3U, tree.size());
  BOOST_CHECK_EQUAL(file, tree[info].parent());
  BOOST_CHECK_EQUAL(1U, tree.children(tree.root()).size());
  BOOST_CHECK_EQUAL(info, tree.children(file).front());

  // Attributes keep their document order.
  BOOST_CHECK_EQUAL(2U, tree.attributes(info).size());
  BOOST_CHECK_EQUAL(string("b"), tree.attributes(info)[0].first);
  BOOST_CHECK_EQUAL(string("a"), tree.attributes(info)[1].first);

  BOOST_CHECK(tree[info].has_attr("a"));
  BOOST_CHECK(! tree[info].has_attr("c"));
  BOOST_CHECK_EQUAL(string("1"), *tree[info].get_attr("a"));
  BOOST_CHECK(! tree[info].get_attr("c"));
  BOOST_CHECK_EQUAL(string(""), tree[info].attr("c"));
}

BOOST_AUTO_TEST_CASE(testParse)
{
  const node_t& root((*doc)[doc->root()]);
  BOOST_CHECK_EQUAL(1U, root.children().size());
  BOOST_CHECK_EQUAL(string("KMYMONEY-FILE"), (*doc)[root.children()[0]].name());

  optional<node_id_t> user = doc->find_node(doc->root(), "KMYMONEY-FILE/USER");
  BOOST_CHECK(user);
  BOOST_CHECK_EQUAL(string("Jane"), (*doc)[*user].attr("name"));
  BOOST_CHECK_EQUAL(string("name"), doc->attributes(*user)[0].first);
  BOOST_CHECK_EQUAL(string("email"), doc->attributes(*user)[1].first);
}

BOOST_AUTO_TEST_CASE(testPathQueries)
{
  node_id_t root = doc->root();

  BOOST_CHECK(doc->has_descendant(root, "KMYMONEY-FILE/ACCOUNTS"));
  BOOST_CHECK(doc->has_descendant(root, "KMYMONEY-FILE/ACCOUNTS/ACCOUNT"));
  BOOST_CHECK(! doc->has_descendant(root, "KMYMONEY-FILE/PAYEES"));
  BOOST_CHECK(! doc->has_descendant(root, "ACCOUNTS"));

  node_ids_t accounts = doc->find_nodes(root, "KMYMONEY-FILE/ACCOUNTS/ACCOUNT");
  BOOST_CHECK_EQUAL(2U, accounts.size());
  BOOST_CHECK_EQUAL(string("A1"), (*doc)[accounts[0]].attr("id"));
  BOOST_CHECK_EQUAL(string("A2"), (*doc)[accounts[1]].attr("id"));

  optional<node_id_t> first =
    doc->find_node(root, "KMYMONEY-FILE/ACCOUNTS/ACCOUNT");
  BOOST_CHECK(first);
  BOOST_CHECK_EQUAL(accounts[0], *first);

  // Paths are relative to the starting node.
  optional<node_id_t> xact =
    doc->find_node(root, "KMYMONEY-FILE/TRANSACTIONS/TRANSACTION");
  BOOST_CHECK(xact);
  node_ids_t splits = doc->find_nodes(*xact, "SPLITS/SPLIT");
  BOOST_CHECK_EQUAL(2U, splits.size());
  BOOST_CHECK_EQUAL(string("S2"), (*doc)[splits[1]].attr("id"));

  node_ids_t all_splits =
    doc->find_nodes(root, "KMYMONEY-FILE/TRANSACTIONS/*/SPLITS/SPLIT");
  BOOST_CHECK_EQUAL(2U, all_splits.size());

  node_ids_t sections = doc->find_nodes(root, "KMYMONEY-FILE/*");
  BOOST_CHECK_EQUAL(4U, sections.size());

  // The ADDRESS of USER is a direct child; a deeper path must be spelled out.
  BOOST_CHECK(doc->has_descendant(root, "KMYMONEY-FILE/USER/ADDRESS"));
  BOOST_CHECK(! doc->has_descendant(root, "KMYMONEY-FILE/ADDRESS"));

  BOOST_CHECK(doc->find_nodes(root, "KMYMONEY-FILE/REPORTS/REPORT").empty());
}

BOOST_AUTO_TEST_CASE(testStripControlCharacters)
{
  BOOST_CHECK_EQUAL(string("ab"), strip_control_characters("a\nb"));
  BOOST_CHECK_EQUAL(string("ab"), strip_control_characters("\ta\r\nb\x7f"));
  BOOST_CHECK_EQUAL(string("ab"), strip_control_characters("a\xc2\x85" "b"));
  BOOST_CHECK_EQUAL(string("a\xc2\xa0" "b"),
                    strip_control_characters("a\xc2\xa0" "b"));
  BOOST_CHECK_EQUAL(string("\xc3\xa9t\xc3\xa9"),
                    strip_control_characters("\xc3\xa9t\xc3\xa9"));
  BOOST_CHECK_EQUAL(string("a\xef\xbf\xbd" "b"),
                    strip_control_characters("a\xff" "b"));
}

BOOST_AUTO_TEST_CASE(testParseControlCharacters)
{
  // Raw control characters are dropped before parsing; character
  // references survive as text.
  unique_ptr<document_t> tree(parser.parse_string(
    "<?xml version=\"1.0\"?>\n"
    "<KMYMONEY-FILE>\n"
    "\t<PAYEES>\r\n"
    "\t\t<PAYEE id=\"P1\" name=\"Bad\x01Name\" notes=\"one&#xa;two\"/>\n"
    "\t</PAYEES>\n"
    "</KMYMONEY-FILE>\n"));

  optional<node_id_t> payee =
    tree->find_node(tree->root(), "KMYMONEY-FILE/PAYEES/PAYEE");
  BOOST_CHECK(payee);
  BOOST_CHECK_EQUAL(string("BadName"), (*tree)[*payee].attr("name"));
  BOOST_CHECK_EQUAL(string("one\ntwo"), (*tree)[*payee].attr("notes"));
}

BOOST_AUTO_TEST_CASE(testParseErrors)
{
  BOOST_CHECK_THROW(parser.parse_string(""), parse_error);
  BOOST_CHECK_THROW(parser.parse_string("<KMYMONEY-FILE>"), parse_error);
  BOOST_CHECK_THROW(parser.parse_string("<A></B>"), parse_error);
  BOOST_CHECK_THROW(parser.parse_string("not xml at all"), parse_error);

  // The parser is reusable after a failure.
  unique_ptr<document_t> tree(parser.parse_string("<A><B/></A>"));
  BOOST_CHECK_EQUAL(3U, tree->size());
}

BOOST_AUTO_TEST_CASE(testRecognizeXml)
{
  std::istringstream plain("<?xml version=\"1.0\"?><A/>");
  BOOST_CHECK(parser.test(plain));
  // test() rewinds the stream
  BOOST_CHECK_EQUAL('<', static_cast<char>(plain.peek()));

  std::istringstream bom("\xEF\xBB\xBF<?xml version=\"1.0\"?><A/>");
  BOOST_CHECK(parser.test(bom));

  std::istringstream gzip("\x1f\x8b\x08\x00\x00\x00\x00\x00");
  BOOST_CHECK(! parser.test(gzip));

  std::istringstream empty("");
  BOOST_CHECK(! parser.test(empty));

  unique_ptr<document_t> tree(parser.parse(bom));
  BOOST_CHECK(tree->has_descendant(tree->root(), "A"));
}

BOOST_AUTO_TEST_CASE(testReadMissingDocument)
{
  BOOST_CHECK_THROW(read_document("/nonexistent/kmyjournal/none.xml"),
                    parse_error);
}

BOOST_AUTO_TEST_SUITE_END()
