#include <sstream>
#include <stdexcept>
#include "attachment_score.h"
#include "conll.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE attachment_score_test

#include <boost/test/unit_test.hpp>

using namespace std;

ConllDocument MakeDocument(const string& text) {
  istringstream in(text);
  ConllDocument document;
  document.Read(in);
  return document;
}

const string kGold =
  "1\tThe\tthe\tDET\tDT\t_\t2\tdet\t_\t_\n"
  "2\tdog\tdog\tNOUN\tNN\t_\t3\tnsubj\t_\t_\n"
  "3\tbarks\tbark\tVERB\tVBZ\t_\t0\troot\t_\t_\n"
  "4\tloudly\tloudly\tADV\tRB\t_\t3\tadvmod:emph\t_\t_\n"
  "\n";

BOOST_AUTO_TEST_CASE(perfect)
{
  ConllDocument gold = MakeDocument(kGold);
  AttachmentScores scores = ScoreAttachments(gold, gold);
  BOOST_CHECK_EQUAL(4u, scores.total);
  BOOST_CHECK_CLOSE(1.0f, scores.UAS(), 1e-4);
  BOOST_CHECK_CLOSE(1.0f, scores.LAS(), 1e-4);
}

BOOST_AUTO_TEST_CASE(partial)
{
  ConllDocument gold = MakeDocument(kGold);
  ConllDocument system = MakeDocument(kGold);
  // wrong head
  system[0].Set(0, kHead, "3");
  // right head, wrong label
  system[0].Set(1, kDeprel, "obj");
  // subtypes are ignored
  system[0].Set(3, kDeprel, "advmod");

  AttachmentScores scores = ScoreAttachments(system, gold);
  BOOST_CHECK_EQUAL(4u, scores.total);
  BOOST_CHECK_EQUAL(3u, scores.correct_heads);
  BOOST_CHECK_EQUAL(2u, scores.correct_labeled);
  BOOST_CHECK_CLOSE(0.75f, scores.UAS(), 1e-4);
  BOOST_CHECK_CLOSE(0.5f, scores.LAS(), 1e-4);
}

BOOST_AUTO_TEST_CASE(empty_documents)
{
  ConllDocument empty;
  AttachmentScores scores = ScoreAttachments(empty, empty);
  BOOST_CHECK_EQUAL(0u, scores.total);
  BOOST_CHECK_EQUAL(0.0f, scores.LAS());
}

BOOST_AUTO_TEST_CASE(mismatched_documents)
{
  ConllDocument gold = MakeDocument(kGold);
  ConllDocument shorter = MakeDocument("1\tThe\tthe\tDET\tDT\t_\t0\troot\t_\t_\n\n");
  BOOST_CHECK_THROW(ScoreAttachments(shorter, gold), runtime_error);

  ConllDocument longer = MakeDocument(kGold + "1\tYes\tyes\tINTJ\tUH\t_\t0\troot\t_\t_\n\n");
  BOOST_CHECK_THROW(ScoreAttachments(longer, gold), runtime_error);
}
