#pragma once
#include <vector>
#include <string>
#include <boost/serialization/access.hpp>
#include <boost/serialization/split_member.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>
#include "dynet/dict.h"
#include "utils.h"

using namespace std;
using namespace dynet;

class ConllDocument;

// Reserved entries shared by every vocabulary
const WordId kPadId = 0;
const WordId kUnkId = 1;
const WordId kRootId = 2;
// Only present in the sub-vocabularies of a CompositeVocab
const WordId kEmptySlotId = 3;

extern const string kPad;
extern const string kUnk;
extern const string kRoot;
extern const string kEmptySlot;

// A frozen string <-> id mapping backed by dynet::Dict. Unknown strings
// map to kUnkId.
class Vocab {
public:
  Vocab();
  explicit Vocab(bool lower, bool reserve_empty_slot = false);

  // Adds every string seen at least cutoff times, most frequent first,
  // then freezes the vocabulary.
  void Build(const vector<string>& tokens, unsigned cutoff);

  WordId Convert(const string& word);
  const string& Convert(WordId id) const;
  bool Contains(const string& word) const;
  unsigned size() const;

private:
  string Normalize(const string& word) const;
  void Reset(const vector<string>& words);

  bool lowercase_input;
  bool reserve_empty_slot;
  Dict dict;

  friend class boost::serialization::access;
  template<class Archive>
  void save(Archive& ar, const unsigned int) const {
    vector<string> words = dict.get_words();
    ar & lowercase_input;
    ar & reserve_empty_slot;
    ar & words;
  }

  template<class Archive>
  void load(Archive& ar, const unsigned int) {
    vector<string> words;
    ar & lowercase_input;
    ar & reserve_empty_slot;
    ar & words;
    Reset(words);
  }
  BOOST_SERIALIZATION_SPLIT_MEMBER()
};

// A tag made of independent slots, each with its own sub-vocabulary.
// Keyed mode splits "Case=Nom|Number=Sing" into named slots (slots missing
// from a token get the "_" entry); positional mode splits on a separator
// and uses the part index as the slot. With an empty separator in
// positional mode there is a single slot holding the whole tag.
class CompositeVocab {
public:
  CompositeVocab();
  CompositeVocab(bool keyed, const string& separator);

  void Build(const vector<string>& tags);

  vector<WordId> Convert(const string& tag);
  unsigned NumSlots() const;
  vector<unsigned> SlotSizes() const;

private:
  vector<string> Split(const string& tag) const;

  bool keyed;
  string separator;
  vector<string> keys;
  vector<Vocab> vocabs;

  friend class boost::serialization::access;
  template<class Archive>
  void serialize(Archive& ar, const unsigned int) {
    ar & keyed;
    ar & separator;
    ar & keys;
    ar & vocabs;
  }
};

// All vocabularies needed to turn a CoNLL-U document into ids.
class MultiVocab {
public:
  MultiVocab();
  MultiVocab(const ConllDocument& train, unsigned cutoff, const string& xpos_separator);

  Vocab word;
  Vocab lemma;
  Vocab upos;
  CompositeVocab xpos;
  CompositeVocab feats;
  Vocab deprel;
  Vocab chars;

private:
  friend class boost::serialization::access;
  template<class Archive>
  void serialize(Archive& ar, const unsigned int) {
    ar & word;
    ar & lemma;
    ar & upos;
    ar & xpos;
    ar & feats;
    ar & deprel;
    ar & chars;
  }
};
