#pragma once
#include <string>
#include "dynet/dynet.h"
#include "vocab.h"

using namespace std;
using namespace dynet;

// Pretrained word vectors read from a word2vec text file. The table lives in
// its own ParameterCollection so it is never handed to a trainer and never
// written into a checkpoint. Rows for the reserved entries are zero.
class Pretrain {
public:
  // Reads at most max_vocab vectors (0 means no limit)
  Pretrain(const string& filename, unsigned max_vocab);

  WordId Convert(const string& word);
  unsigned Dim() const;
  unsigned size() const;
  LookupParameter Embeddings() const;

private:
  Vocab vocab;
  unsigned dim;
  ParameterCollection model;
  LookupParameter embeddings;
};
