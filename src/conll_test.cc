#include <sstream>
#include <stdexcept>
#include "conll.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE conll_test

#include <boost/test/unit_test.hpp>

using namespace std;

const string kSample =
  "# sent_id = 1\n"
  "# text = Don't go.\n"
  "1-2\tDon't\t_\t_\t_\t_\t_\t_\t_\t_\n"
  "1\tDo\tdo\tAUX\tVB\tMood=Imp\t3\taux\t_\t_\n"
  "2\tn't\tnot\tPART\tRB\tPolarity=Neg\t3\tadvmod\t_\t_\n"
  "3\tgo\tgo\tVERB\tVB\tVerbForm=Inf\t0\troot\t_\tSpaceAfter=No\n"
  "3.1\tgone\t_\t_\t_\t_\t_\t_\t3:ref\t_\n"
  "4\t.\t.\tPUNCT\t.\t_\t3\tpunct\t_\t_\n"
  "\n"
  "1\tYes\tyes\tINTJ\tUH\t_\t0\troot\t_\t_\n"
  "\n";

BOOST_AUTO_TEST_CASE(read_words)
{
  istringstream in(kSample);
  ConllDocument document;
  document.Read(in);

  BOOST_REQUIRE_EQUAL(2u, document.NumSentences());
  BOOST_CHECK_EQUAL(5u, document.NumWords());

  const ConllSentence& first = document[0];
  BOOST_REQUIRE_EQUAL(4u, first.NumWords());
  BOOST_CHECK_EQUAL("Do", first.Get(0, kForm));
  BOOST_CHECK_EQUAL("go", first.Get(2, kForm));
  BOOST_CHECK_EQUAL(".", first.Get(3, kForm));
  BOOST_CHECK_EQUAL("0", first.Get(2, kHead));

  vector<string> relations = first.Column(kDeprel);
  BOOST_CHECK(relations == vector<string>({"aux", "advmod", "root", "punct"}));
}

BOOST_AUTO_TEST_CASE(round_trip_keeps_every_line)
{
  istringstream in(kSample);
  ConllDocument document;
  document.Read(in);

  ostringstream out;
  document.Write(out);
  BOOST_CHECK_EQUAL(kSample, out.str());
}

BOOST_AUTO_TEST_CASE(set_only_touches_words)
{
  istringstream in(kSample);
  ConllDocument document;
  document.Read(in);

  document[0].Set(0, kHead, "2");
  document[0].Set(0, kDeprel, "dep");
  BOOST_CHECK_EQUAL("2", document[0].Get(0, kHead));

  ostringstream out;
  document.Write(out);
  const string written = out.str();
  BOOST_CHECK(written.find("1-2\tDon't\t_\t_\t_\t_\t_\t_\t_\t_\n") != string::npos);
  BOOST_CHECK(written.find("1\tDo\tdo\tAUX\tVB\tMood=Imp\t2\tdep\t_\t_\n") != string::npos);
}

BOOST_AUTO_TEST_CASE(windows_line_endings)
{
  istringstream in("1\tA\ta\tDET\tDT\t_\t0\troot\t_\t_\r\n\r\n");
  ConllDocument document;
  document.Read(in);
  BOOST_REQUIRE_EQUAL(1u, document.NumSentences());
  BOOST_CHECK_EQUAL("root", document[0].Get(0, kDeprel));
  BOOST_CHECK_EQUAL("_", document[0].Get(0, kMisc));
}

BOOST_AUTO_TEST_CASE(missing_final_blank_line)
{
  istringstream in("1\tA\ta\tDET\tDT\t_\t0\troot\t_\t_");
  ConllDocument document;
  document.Read(in);
  BOOST_CHECK_EQUAL(1u, document.NumSentences());
}

BOOST_AUTO_TEST_CASE(wrong_column_count)
{
  istringstream in("1\tA\ta\tDET\n\n");
  ConllDocument document;
  BOOST_CHECK_THROW(document.Read(in), runtime_error);
}

BOOST_AUTO_TEST_CASE(missing_file)
{
  BOOST_CHECK_THROW(ConllDocument::ReadFile("/nonexistent/directory/file.conllu"), runtime_error);
}
