#include <algorithm>
#include "char_model.h"
#include "vocab.h"

CharacterModel::CharacterModel(ParameterCollection& model, unsigned char_vocab_size, unsigned char_emb_dim, unsigned hidden_dim, unsigned num_layers) :
    dropout_rate(0.0f), pcg(nullptr) {
  char_embeddings = model.add_lookup_parameters(char_vocab_size, {char_emb_dim});
  char_lstm = VanillaLSTMBuilder(num_layers, char_emb_dim, hidden_dim, model);
}

void CharacterModel::NewGraph(ComputationGraph& cg) {
  pcg = &cg;
  char_lstm.new_graph(cg);
}

void CharacterModel::SetDropout(float rate) {
  dropout_rate = rate;
  if (rate > 0.0f) {
    char_lstm.set_dropout(rate);
  }
  else {
    char_lstm.disable_dropout();
  }
}

vector<Expression> CharacterModel::Embed(const Batch& batch) {
  const unsigned N = batch.size();
  const unsigned T = batch.Length();
  const unsigned M = N * T;

  // Every (t, b) position becomes one element of a single flat batch,
  // ordered by time step. Padding positions read one padding character.
  unsigned max_chars = 1;
  for (unsigned b = 0; b < N; ++b) {
    for (unsigned t = 0; t < T; ++t) {
      max_chars = max(max_chars, (unsigned)batch.chars[b][t].size());
    }
  }

  char_lstm.start_new_sequence();
  if (dropout_rate > 0.0f) {
    char_lstm.set_dropout_masks(M);
  }

  Expression final_state;
  for (unsigned c = 0; c < max_chars; ++c) {
    vector<unsigned> ids(M, kPadId);
    vector<float> is_last(M, 0.0f);
    for (unsigned t = 0; t < T; ++t) {
      for (unsigned b = 0; b < N; ++b) {
        const vector<WordId>& chars = batch.chars[b][t];
        const unsigned length = max(1u, (unsigned)chars.size());
        if (c < chars.size()) {
          ids[t * N + b] = chars[c];
        }
        is_last[t * N + b] = (c == length - 1) ? 1.0f : 0.0f;
      }
    }

    Expression x = lookup(*pcg, char_embeddings, ids);
    if (dropout_rate > 0.0f) {
      x = dropout(x, dropout_rate);
    }
    Expression h = char_lstm.add_input(x);
    Expression mask = input(*pcg, Dim({1}, M), is_last);
    Expression selected = h * mask;
    final_state = (c == 0) ? selected : final_state + selected;
  }

  vector<Expression> outputs(T);
  for (unsigned t = 0; t < T; ++t) {
    vector<unsigned> elements(N);
    for (unsigned b = 0; b < N; ++b) {
      elements[b] = t * N + b;
    }
    outputs[t] = pick_batch_elems(final_state, elements);
  }
  return outputs;
}
