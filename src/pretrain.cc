#include <iostream>
#include <fstream>
#include <set>
#include <stdexcept>
#include "pretrain.h"

Pretrain::Pretrain(const string& filename, unsigned max_vocab) : vocab(true), dim(0) {
  ifstream f(filename);
  if (!f.is_open()) {
    throw runtime_error("Unable to open " + filename + " for reading.");
  }

  vector<string> words;
  vector<vector<float>> vectors;
  set<string> seen;
  bool first_line = true;
  for (string line; getline(f, line);) {
    vector<string> parts = strip(tokenize(strip(line), ' '), true);
    if (parts.size() == 0) {
      continue;
    }

    // word2vec files may start with a "<count> <dim>" header
    if (first_line && parts.size() == 2 && parts[0].find_first_not_of("0123456789") == string::npos) {
      first_line = false;
      continue;
    }
    first_line = false;

    if (max_vocab > 0 && words.size() >= max_vocab) {
      break;
    }

    if (dim == 0) {
      dim = parts.size() - 1;
    }
    if (dim == 0 || parts.size() != dim + 1) {
      throw runtime_error("Malformed line in " + filename + ": expected a word and " + to_string(dim) + " values.");
    }

    // The file lists frequent words first, so the first casing of a word wins
    string word = lowercase(parts[0]);
    if (seen.count(word) > 0) {
      continue;
    }
    seen.insert(word);

    vector<float> values(dim);
    for (unsigned i = 0; i < dim; ++i) {
      values[i] = stof(parts[i + 1]);
    }
    words.push_back(word);
    vectors.push_back(values);
  }

  if (dim == 0) {
    throw runtime_error("No vectors found in " + filename);
  }

  vocab.Build(words, 1);
  embeddings = model.add_lookup_parameters(vocab.size(), {dim}, ParameterInitConst(0.0f));
  for (unsigned i = 0; i < words.size(); ++i) {
    embeddings.initialize(vocab.Convert(words[i]), vectors[i]);
  }
  cerr << "Read " << words.size() << " pretrained vectors of dimension " << dim << " from " << filename << endl;
}

WordId Pretrain::Convert(const string& word) {
  return vocab.Convert(word);
}

unsigned Pretrain::Dim() const {
  return dim;
}

unsigned Pretrain::size() const {
  return vocab.size();
}

LookupParameter Pretrain::Embeddings() const {
  return embeddings;
}
