#include "rnn_utils.h"

vector<Expression> ReversePaddedSequence(const vector<Expression>& inputs, const vector<unsigned>& lengths) {
  const unsigned T = inputs.size();
  if (lengths.empty()) {
    return inputs;
  }
  vector<Expression> reversed(T);
  for (unsigned t = 0; t < T; ++t) {
    vector<unsigned> sources(lengths.size());
    bool uniform = true;
    for (unsigned b = 0; b < lengths.size(); ++b) {
      sources[b] = ReversedIndex(t, lengths[b]);
      uniform = uniform && (sources[b] == sources[0]);
    }

    if (uniform) {
      reversed[t] = inputs[sources[0]];
      continue;
    }

    vector<Expression> elements(lengths.size());
    for (unsigned b = 0; b < lengths.size(); ++b) {
      elements[b] = pick_batch_elem(inputs[sources[b]], b);
    }
    reversed[t] = concatenate_to_batch(elements);
  }
  return reversed;
}
