#pragma once
#include <vector>
#include <memory>
#include "dynet/dynet.h"
#include "dynet/expr.h"
#include "batch.h"
#include "config.h"
#include "embedder.h"
#include "encoder.h"
#include "scorer.h"

using namespace std;
using namespace dynet;

class MultiVocab;
class Pretrain;

// Inference output for one sentence, root included, trimmed to its length
struct SentencePrediction {
  unsigned index; // position of the sentence in its document
  vector<vector<float>> head_log_probs; // [dependent][head]
  vector<vector<WordId>> labels; // [dependent][head]

  // Most probable head of every token; entry 0 (the root) is kIgnoreHead
  vector<int> Heads() const;
};

struct ForwardResult {
  Expression loss;
  vector<SentencePrediction> predictions; // empty when training
};

// The graph-based parser: feature fusion, contextualization, pairwise
// arc and label scoring, and the loss or prediction head on top.
//
// Parameters are split into groups so that each can be trained, frozen or
// given a learning rate on its own: the input features, one group per
// recurrent depth, and the scorers.
class Parser {
public:
  Parser(ParameterCollection& model, const ParserConfig& config, const MultiVocab& vocab, Pretrain* pretrain);

  ForwardResult Forward(const Batch& batch, ComputationGraph& cg, bool training);

  // Masked arc scores, {T, T} batched over sentences. Exposed for testing.
  Expression ArcScores(const Batch& batch, ComputationGraph& cg, bool training);

  unsigned NumLayers() const;
  ParameterCollection& FeatureGroup();
  ParameterCollection& LayerGroup(unsigned layer);
  ParameterCollection& ScorerGroup();
  void SetLayerTrainable(unsigned layer, bool trainable);
  bool IsLayerTrainable(unsigned layer) const;

  // Copies the input features and the recurrent layers of a parser with the
  // same input and encoder layout. Scorers keep their initial values.
  void InitializeFrom(Parser& source);

  const ParserConfig& Config() const;
  void Reseed(unsigned seed);

private:
  struct Scores {
    Expression arcs; // {T, T}, masked
    Expression labels; // {T, L * T}
    Expression linearization; // raw {T, T}
    Expression distance_kld; // {T, T}
  };

  Scores ComputeScores(const Batch& batch, ComputationGraph& cg, bool training);
  Expression ComputeLoss(const Batch& batch, ComputationGraph& cg, const Scores& scores);
  vector<SentencePrediction> ComputePredictions(const Batch& batch, ComputationGraph& cg, const Scores& scores);
  void NewGraph(ComputationGraph& cg, bool training);
  Expression Drop(Expression x, bool training);

  ParserConfig config;
  unsigned num_labels;

  ParameterCollection feature_group;
  vector<ParameterCollection> layer_groups;
  ParameterCollection scorer_group;
  vector<bool> layer_trainable;

  unique_ptr<FeatureEmbedder> embedder;
  unique_ptr<EncoderModel> encoder;
  unique_ptr<PairwiseScorer> unlabeled;
  unique_ptr<PairwiseScorer> deprel;
  unique_ptr<PairwiseScorer> linearization;
  unique_ptr<PairwiseScorer> distance;
};
