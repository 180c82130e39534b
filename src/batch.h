#pragma once
#include <vector>
#include <string>
#include "utils.h"

using namespace std;

class ConllDocument;
class MultiVocab;
class Pretrain;

// Head of the root position and of padding. Never a valid head index.
const int kIgnoreHead = -1;

// One sentence converted to ids. Position 0 is the artificial root.
struct EncodedSentence {
  vector<WordId> words;
  vector<WordId> lemmas;
  vector<WordId> upos;
  vector<vector<WordId>> xpos; // [position][slot]
  vector<vector<WordId>> feats; // [position][slot]
  vector<WordId> pretrained;
  vector<vector<WordId>> chars; // [position][character]
  vector<int> heads;
  vector<WordId> deprels;
  unsigned index; // position of the sentence in its document

  unsigned size() const;
};

// A group of sentences padded to the length of the longest one.
// Every field is sentence-major: field[b][t].
class Batch {
public:
  Batch();
  explicit Batch(const vector<const EncodedSentence*>& sentences);

  unsigned size() const; // number of sentences
  unsigned Length() const; // padded length, root included
  unsigned NumWords() const; // real tokens, root excluded
  bool IsPadding(unsigned b, unsigned t) const;

  // Ids of every sentence at time step t, ready for a batched lookup
  vector<unsigned> AtStep(const vector<vector<WordId>>& ids, unsigned t) const;
  vector<unsigned> AtStep(const vector<vector<vector<WordId>>>& ids, unsigned t, unsigned slot) const;

  vector<unsigned> lengths;
  vector<unsigned> original_index;
  vector<vector<WordId>> words;
  vector<vector<WordId>> lemmas;
  vector<vector<WordId>> upos;
  vector<vector<vector<WordId>>> xpos;
  vector<vector<vector<WordId>>> feats;
  vector<vector<WordId>> pretrained;
  vector<vector<vector<WordId>>> chars; // padding positions have no characters
  vector<vector<int>> heads;
  vector<vector<WordId>> deprels;

private:
  unsigned length;
};

class BatchProvider {
public:
  virtual ~BatchProvider() {}
  virtual unsigned size() const = 0;
  virtual const Batch& operator[](unsigned i) const = 0;
  virtual void Reshuffle() = 0;
};

// Converts a document into batches of at most batch_size words.
// In training mode sentences are sorted by length with some jitter and the
// batch order is shuffled on every Reshuffle(). Otherwise sentences are
// sorted by length once and Reshuffle() does nothing; each batch records
// the document position of its sentences.
class DataLoader : public BatchProvider {
public:
  DataLoader(const ConllDocument& document, MultiVocab& vocab, Pretrain* pretrain, unsigned batch_size, bool training, float sample_fraction = 1.0f);

  unsigned size() const override;
  const Batch& operator[](unsigned i) const override;
  void Reshuffle() override;
  unsigned NumSentences() const;

private:
  void MakeBatches(const vector<unsigned>& order);

  unsigned batch_size;
  bool training;
  vector<EncodedSentence> sentences;
  vector<Batch> batches;
};

EncodedSentence EncodeSentence(const ConllDocument& document, unsigned index, MultiVocab& vocab, Pretrain* pretrain);
