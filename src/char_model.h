#pragma once
#include <vector>
#include "dynet/dynet.h"
#include "dynet/lstm.h"
#include "dynet/expr.h"
#include "batch.h"

using namespace std;
using namespace dynet;

// Reads the characters of each word with an LSTM and represents the word
// by the LSTM's last hidden state.
class CharacterModel {
public:
  CharacterModel(ParameterCollection& model, unsigned char_vocab_size, unsigned char_emb_dim, unsigned hidden_dim, unsigned num_layers);

  void NewGraph(ComputationGraph& cg);
  void SetDropout(float rate);

  // One expression per time step of the batch, each batched over sentences.
  // Vectors at padding positions are meaningless.
  vector<Expression> Embed(const Batch& batch);

private:
  float dropout_rate;
  LookupParameter char_embeddings;
  VanillaLSTMBuilder char_lstm;
  ComputationGraph* pcg;
};
