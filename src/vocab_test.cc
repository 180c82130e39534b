#include <sstream>
#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>
#include "vocab.h"
#include "conll.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE vocab_test

#include <boost/test/unit_test.hpp>

using namespace std;

BOOST_AUTO_TEST_CASE(reserved_ids)
{
  Vocab vocab(false);
  vocab.Build({"a", "b", "a"}, 1);

  BOOST_CHECK_EQUAL(kPadId, vocab.Convert(kPad));
  BOOST_CHECK_EQUAL(kUnkId, vocab.Convert(kUnk));
  BOOST_CHECK_EQUAL(kRootId, vocab.Convert(kRoot));
  BOOST_CHECK_EQUAL(5u, vocab.size());
  // most frequent first
  BOOST_CHECK_EQUAL(3, vocab.Convert("a"));
  BOOST_CHECK_EQUAL(4, vocab.Convert("b"));
  BOOST_CHECK_EQUAL("a", vocab.Convert(3));
  BOOST_CHECK_EQUAL(kUnkId, vocab.Convert("never seen"));
}

BOOST_AUTO_TEST_CASE(cutoff_and_lowercase)
{
  Vocab vocab(true);
  vocab.Build({"The", "the", "THE", "dog", "Dog", "cat"}, 2);

  BOOST_CHECK(vocab.Contains("the"));
  BOOST_CHECK(vocab.Contains("dog"));
  BOOST_CHECK(!vocab.Contains("cat"));
  BOOST_CHECK_EQUAL(vocab.Convert("the"), vocab.Convert("The"));
  BOOST_CHECK_EQUAL(kUnkId, vocab.Convert("cat"));
  // reserved strings are not lowercased
  BOOST_CHECK_EQUAL(kRootId, vocab.Convert(kRoot));
}

BOOST_AUTO_TEST_CASE(keyed_composite)
{
  CompositeVocab feats(true, "|");
  feats.Build({"Case=Nom|Number=Sing", "Number=Plur", "_"});

  BOOST_REQUIRE_EQUAL(2u, feats.NumSlots());
  vector<unsigned> sizes = feats.SlotSizes();
  // reserved entries plus "_" plus the values
  BOOST_CHECK_EQUAL(5u, sizes[0]);
  BOOST_CHECK_EQUAL(6u, sizes[1]);

  vector<WordId> ids = feats.Convert("Number=Sing");
  BOOST_REQUIRE_EQUAL(2u, ids.size());
  BOOST_CHECK_EQUAL(kEmptySlotId, ids[0]);
  BOOST_CHECK(ids[1] > kEmptySlotId);

  vector<WordId> empty = feats.Convert("_");
  BOOST_CHECK_EQUAL(kEmptySlotId, empty[0]);
  BOOST_CHECK_EQUAL(kEmptySlotId, empty[1]);

  vector<WordId> unknown = feats.Convert("Case=Voc|Gender=Masc");
  BOOST_CHECK_EQUAL(kUnkId, unknown[0]);
  BOOST_CHECK_EQUAL(kEmptySlotId, unknown[1]);

  vector<WordId> root = feats.Convert(kRoot);
  BOOST_CHECK_EQUAL(kRootId, root[0]);
  BOOST_CHECK_EQUAL(kRootId, root[1]);
}

BOOST_AUTO_TEST_CASE(positional_composite)
{
  CompositeVocab xpos(false, ",");
  xpos.Build({"N,sg,nom", "V,sg", "N,pl,acc"});
  BOOST_CHECK_EQUAL(3u, xpos.NumSlots());

  vector<WordId> ids = xpos.Convert("V,sg");
  BOOST_CHECK(ids[0] > kEmptySlotId);
  BOOST_CHECK_EQUAL(ids[1], xpos.Convert("N,sg,nom")[1]);
  BOOST_CHECK_EQUAL(kEmptySlotId, ids[2]);

  CompositeVocab whole(false, "");
  whole.Build({"NN", "VBZ"});
  BOOST_CHECK_EQUAL(1u, whole.NumSlots());
  BOOST_CHECK(whole.Convert("NN")[0] != whole.Convert("VBZ")[0]);
}

BOOST_AUTO_TEST_CASE(composite_without_data)
{
  CompositeVocab feats(true, "|");
  feats.Build({"_", "_"});
  BOOST_CHECK_EQUAL(1u, feats.NumSlots());
  BOOST_CHECK_EQUAL(kEmptySlotId, feats.Convert("_")[0]);
}

BOOST_AUTO_TEST_CASE(multi_vocab_from_document)
{
  istringstream in(
    "1\tDogs\tdog\tNOUN\tNNS\tNumber=Plur\t2\tnsubj\t_\t_\n"
    "2\tbark\tbark\tVERB\tVBP\t_\t0\troot\t_\t_\n"
    "\n");
  ConllDocument document;
  document.Read(in);

  MultiVocab vocab(document, 1, "");
  BOOST_CHECK(vocab.word.Contains("dogs"));
  BOOST_CHECK(vocab.lemma.Contains("bark"));
  BOOST_CHECK(vocab.upos.Contains("VERB"));
  BOOST_CHECK(vocab.deprel.Contains("nsubj"));
  BOOST_CHECK(vocab.chars.Contains("D"));
  BOOST_CHECK_EQUAL(1u, vocab.feats.NumSlots());

  // Cutoff drops words seen once
  MultiVocab strict(document, 2, "");
  BOOST_CHECK(!strict.word.Contains("dogs"));
  BOOST_CHECK(strict.deprel.Contains("nsubj"));
}

BOOST_AUTO_TEST_CASE(serialization)
{
  MultiVocab vocab;
  vocab.word = Vocab(true);
  vocab.word.Build({"Alpha", "beta"}, 1);
  vocab.feats = CompositeVocab(true, "|");
  vocab.feats.Build({"Case=Nom", "Case=Acc|Number=Sing"});

  stringstream stream;
  {
    boost::archive::text_oarchive oa(stream);
    oa & vocab;
  }

  MultiVocab loaded;
  boost::archive::text_iarchive ia(stream);
  ia & loaded;

  BOOST_CHECK_EQUAL(vocab.word.size(), loaded.word.size());
  BOOST_CHECK_EQUAL(vocab.word.Convert("ALPHA"), loaded.word.Convert("alpha"));
  BOOST_CHECK_EQUAL(kUnkId, loaded.word.Convert("gamma"));
  BOOST_CHECK(vocab.feats.Convert("Number=Sing") == loaded.feats.Convert("Number=Sing"));
}
