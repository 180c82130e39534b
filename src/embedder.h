#pragma once
#include <vector>
#include <memory>
#include <random>
#include "dynet/dynet.h"
#include "dynet/expr.h"
#include "utils.h"
#include "batch.h"
#include "config.h"
#include "char_model.h"

using namespace std;
using namespace dynet;

class MultiVocab;
class Pretrain;

// Builds one vector per token by concatenating every enabled source:
// pretrained vectors, word, lemma, the summed coarse and fine tag block,
// the summed morphological feature block, and the character model output.
// Pretrained and character vectors are linearly projected first.
class FeatureEmbedder {
public:
  FeatureEmbedder(ParameterCollection& model, const ParserConfig& config, const MultiVocab& vocab, Pretrain* pretrain);

  void NewGraph(ComputationGraph& cg);
  void SetDropout(float word_dropout, float dropout);
  void Reseed(unsigned seed);
  unsigned Dim() const;

  vector<Expression> Embed(const Batch& batch);

private:
  Expression EmbedStep(const Batch& batch, unsigned t, const vector<Expression>& char_reps);
  Expression WordDropout(Expression x, unsigned batch_size);

  unsigned input_dim;
  unsigned word_emb_dim;
  unsigned lemma_emb_dim;
  unsigned tag_emb_dim;
  float word_dropout_rate;
  float dropout_rate;
  mt19937 rng;

  Pretrain* pretrain;
  Parameter p_trans_pretrained;
  LookupParameter word_embeddings;
  LookupParameter lemma_embeddings;
  LookupParameter upos_embeddings;
  vector<LookupParameter> xpos_embeddings;
  vector<LookupParameter> feats_embeddings;
  unique_ptr<CharacterModel> char_model;
  Parameter p_trans_char;
  Parameter p_drop_replacement;

  Expression trans_pretrained;
  Expression trans_char;
  Expression drop_replacement;
  ComputationGraph* pcg;
};
