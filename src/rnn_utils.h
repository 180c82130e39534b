#pragma once
#include <vector>
#include <cassert>
#include "dynet/dynet.h"
#include "dynet/expr.h"

using namespace std;
using namespace dynet;

// Position that time step t of sentence with the given length reads from
// when the sentence is reversed. Only the first length steps move; the
// padding suffix stays where it is.
inline unsigned ReversedIndex(unsigned t, unsigned length) {
  return (t < length) ? length - 1 - t : t;
}

// Reverses each padded sequence of a sentence-major batch within its own length.
// Applying it twice gives back the input.
template<class T>
vector<vector<T>> ReversePaddedSequence(const vector<vector<T>>& batch, const vector<unsigned>& lengths) {
  assert (batch.size() == lengths.size());
  vector<vector<T>> reversed(batch.size());
  for (unsigned b = 0; b < batch.size(); ++b) {
    reversed[b].reserve(batch[b].size());
    for (unsigned t = 0; t < batch[b].size(); ++t) {
      reversed[b].push_back(batch[b][ReversedIndex(t, lengths[b])]);
    }
  }
  return reversed;
}

// Same operation on a time-major sequence of batched expressions, where
// inputs[t] holds time step t of every sentence as one batch element.
vector<Expression> ReversePaddedSequence(const vector<Expression>& inputs, const vector<unsigned>& lengths);
