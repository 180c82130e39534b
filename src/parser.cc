#include <limits>
#include <stdexcept>
#include "parser.h"
#include "vocab.h"
#include "pretrain.h"
#include "io.h"

const float kNegativeInfinity = -numeric_limits<float>::infinity();

vector<int> SentencePrediction::Heads() const {
  vector<int> heads(head_log_probs.size(), kIgnoreHead);
  for (unsigned i = 1; i < head_log_probs.size(); ++i) {
    unsigned best = 0;
    for (unsigned j = 1; j < head_log_probs[i].size(); ++j) {
      if (head_log_probs[i][j] > head_log_probs[i][best]) {
        best = j;
      }
    }
    heads[i] = best;
  }
  return heads;
}

// log(sigmoid(x)) without overflow: min(x, 0) - log(1 + exp(-|x|))
Expression LogSigmoid(const Expression& x) {
  Expression a = abs(x);
  return (x - a) * 0.5f - log(1.0f + exp(-a));
}

// log(1 + exp(x)) without overflow: max(x, 0) + log(1 + exp(-|x|))
Expression Softplus(const Expression& x) {
  Expression a = abs(x);
  return (x + a) * 0.5f + log(1.0f + exp(-a));
}

// A {T, T} constant for every sentence of the batch, with entry (i, j)
// given by f(b, i, j)
template<class F>
Expression PairwiseInput(ComputationGraph& cg, const Batch& batch, F f) {
  const unsigned T = batch.Length();
  const unsigned N = batch.size();
  vector<float> values(T * T * N);
  for (unsigned b = 0; b < N; ++b) {
    for (unsigned j = 0; j < T; ++j) {
      for (unsigned i = 0; i < T; ++i) {
        values[b * T * T + j * T + i] = f(b, i, j);
      }
    }
  }
  return input(cg, Dim({T, T}, N), values);
}

Parser::Parser(ParameterCollection& model, const ParserConfig& config, const MultiVocab& vocab, Pretrain* pretrain) : config(config) {
  config.Validate();
  num_labels = vocab.deprel.size();

  feature_group = model.add_subcollection("features");
  for (unsigned k = 0; k < config.num_layers; ++k) {
    layer_groups.push_back(model.add_subcollection("layer" + to_string(k)));
  }
  scorer_group = model.add_subcollection("scorers");
  layer_trainable = vector<bool>(config.num_layers, true);

  embedder.reset(new FeatureEmbedder(feature_group, config, vocab, pretrain));
  encoder.reset(CreateEncoderModel(config, layer_groups, embedder->Dim()));

  const unsigned context_dim = encoder->OutputDim();
  unlabeled.reset(CreatePairwiseScorer(config.scorer, scorer_group, context_dim, config.deep_biaff_hidden_dim, 1));
  if (config.use_deprel_loss) {
    deprel.reset(CreatePairwiseScorer(config.scorer, scorer_group, context_dim, config.deep_biaff_hidden_dim, num_labels));
  }
  if (config.use_linearization) {
    linearization.reset(new DeepBiaffineScorer(scorer_group, context_dim, config.deep_biaff_hidden_dim, 1));
  }
  if (config.use_distance) {
    distance.reset(new DeepBiaffineScorer(scorer_group, context_dim, config.deep_biaff_hidden_dim, 1));
  }
}

void Parser::NewGraph(ComputationGraph& cg, bool training) {
  embedder->NewGraph(cg);
  embedder->SetDropout(training ? config.word_dropout : 0.0f, training ? config.dropout : 0.0f);
  encoder->NewGraph(cg, layer_trainable);
  encoder->SetDropout(training ? config.dropout : 0.0f, training ? config.rec_dropout : 0.0f);

  for (PairwiseScorer* scorer : {unlabeled.get(), deprel.get(), linearization.get(), distance.get()}) {
    if (scorer != nullptr) {
      scorer->NewGraph(cg);
      scorer->SetDropout(training ? config.dropout : 0.0f);
    }
  }
}

Expression Parser::Drop(Expression x, bool training) {
  if (training && config.dropout > 0.0f) {
    return dropout(x, config.dropout);
  }
  return x;
}

Parser::Scores Parser::ComputeScores(const Batch& batch, ComputationGraph& cg, bool training) {
  NewGraph(cg, training);
  vector<Expression> embeddings = embedder->Embed(batch);
  vector<Expression> context = encoder->Encode(embeddings, batch.lengths);
  Expression X = concatenate_cols(context);

  Scores scores;
  Expression arcs = unlabeled->Score(Drop(X, training), Drop(X, training));

  if (linearization) {
    Expression sign = PairwiseInput(cg, batch, [](unsigned, unsigned i, unsigned j) {
      return (j > i) ? 1.0f : ((j < i) ? -1.0f : 0.0f);
    });
    scores.linearization = linearization->Score(Drop(X, training), Drop(X, training));
    arcs = arcs + nobackprop(LogSigmoid(cmult(scores.linearization, sign)));
  }

  if (distance) {
    Expression target = PairwiseInput(cg, batch, [](unsigned, unsigned i, unsigned j) {
      return (float)((j > i) ? j - i : i - j);
    });
    Expression prediction = 1.0f + Softplus(distance->Score(Drop(X, training), Drop(X, training)));
    scores.distance_kld = -log(square(target - prediction) * 0.5f + 1.0f);
    arcs = arcs + nobackprop(scores.distance_kld);
  }

  // No token heads itself or a padding position. The root column stays open.
  Expression mask = PairwiseInput(cg, batch, [&batch](unsigned b, unsigned i, unsigned j) {
    return (i == j || batch.IsPadding(b, j)) ? kNegativeInfinity : 0.0f;
  });
  scores.arcs = arcs + mask;

  if (deprel) {
    scores.labels = deprel->Score(Drop(X, training), Drop(X, training));
  }
  return scores;
}

Expression Parser::ComputeLoss(const Batch& batch, ComputationGraph& cg, const Scores& scores) {
  const unsigned T = batch.Length();
  const unsigned N = batch.size();

  vector<Expression> terms;
  for (unsigned i = 1; i < T; ++i) {
    // Root and padding rows keep a valid index but get zero weight
    vector<unsigned> heads(N, 0);
    vector<unsigned> relations(N, 0);
    vector<unsigned> directions(N, 0);
    vector<float> weights(N, 0.0f);
    bool any = false;
    for (unsigned b = 0; b < N; ++b) {
      int head = batch.heads[b][i];
      if (head == kIgnoreHead) {
        continue;
      }
      heads[b] = head;
      relations[b] = batch.deprels[b][i];
      directions[b] = (head > (int)i) ? 1 : 0;
      weights[b] = 1.0f;
      any = true;
    }
    if (!any) {
      continue;
    }

    Expression weight = input(cg, Dim({1}, N), weights);
    terms.push_back(cmult(pickneglogsoftmax(pick(scores.arcs, i, 0), heads), weight));

    if (deprel) {
      Expression by_head = reshape(pick(scores.labels, i, 0), Dim({num_labels, T}));
      Expression gold_head_labels = pick(by_head, heads, 1);
      terms.push_back(cmult(pickneglogsoftmax(gold_head_labels, relations), weight));
    }

    if (linearization) {
      Expression s = pick(pick(scores.linearization, i, 0), heads);
      Expression logits = concatenate({s * -0.5f, s * 0.5f});
      terms.push_back(cmult(pickneglogsoftmax(logits, directions), weight));
    }

    if (distance) {
      Expression kld = pick(pick(scores.distance_kld, i, 0), heads);
      terms.push_back(-cmult(kld, weight));
    }
  }

  if (terms.size() == 0) {
    return input(cg, 0.0f);
  }

  Expression loss = sum_batches(sum(terms));
  const unsigned word_count = batch.NumWords();
  if (word_count > 0) {
    loss = loss / (float)word_count;
  }
  return loss;
}

vector<SentencePrediction> Parser::ComputePredictions(const Batch& batch, ComputationGraph& cg, const Scores& scores) {
  const unsigned T = batch.Length();
  const unsigned N = batch.size();
  const unsigned L = num_labels;

  // Column i of the transposed matrix is the distribution of dependent i
  Expression log_probs = log_softmax(transpose(scores.arcs));
  vector<float> arc_values = as_vector(cg.incremental_forward(log_probs));
  vector<float> label_values;
  if (deprel) {
    label_values = as_vector(cg.incremental_forward(scores.labels));
  }

  vector<SentencePrediction> predictions(N);
  for (unsigned b = 0; b < N; ++b) {
    const unsigned length = batch.lengths[b];
    SentencePrediction& prediction = predictions[b];
    prediction.index = batch.original_index[b];
    prediction.head_log_probs.assign(length, vector<float>(length));
    prediction.labels.assign(length, vector<WordId>(length, kPadId));

    for (unsigned i = 0; i < length; ++i) {
      for (unsigned j = 0; j < length; ++j) {
        prediction.head_log_probs[i][j] = arc_values[b * T * T + i * T + j];
        if (!deprel) {
          continue;
        }

        const float* label_scores = &label_values[b * T * L * T];
        WordId best = 0;
        for (unsigned l = 1; l < L; ++l) {
          if (label_scores[i + (l + j * L) * T] > label_scores[i + (best + j * L) * T]) {
            best = l;
          }
        }
        prediction.labels[i][j] = best;
      }
    }
  }
  return predictions;
}

Expression Parser::ArcScores(const Batch& batch, ComputationGraph& cg, bool training) {
  return ComputeScores(batch, cg, training).arcs;
}

ForwardResult Parser::Forward(const Batch& batch, ComputationGraph& cg, bool training) {
  Scores scores = ComputeScores(batch, cg, training);
  ForwardResult result;
  if (training) {
    result.loss = ComputeLoss(batch, cg, scores);
  }
  else {
    result.loss = input(cg, 0.0f);
    result.predictions = ComputePredictions(batch, cg, scores);
  }
  return result;
}

unsigned Parser::NumLayers() const {
  return layer_groups.size();
}

ParameterCollection& Parser::FeatureGroup() {
  return feature_group;
}

ParameterCollection& Parser::LayerGroup(unsigned layer) {
  return layer_groups.at(layer);
}

ParameterCollection& Parser::ScorerGroup() {
  return scorer_group;
}

void Parser::InitializeFrom(Parser& source) {
  if (source.NumLayers() != NumLayers()) {
    throw runtime_error("Unable to initialize a parser with " + to_string(NumLayers()) + " layers from one with " + to_string(source.NumLayers()));
  }
  CopyParameters(source.FeatureGroup(), feature_group);
  for (unsigned k = 0; k < NumLayers(); ++k) {
    CopyParameters(source.LayerGroup(k), layer_groups[k]);
  }
}

void Parser::SetLayerTrainable(unsigned layer, bool trainable) {
  layer_trainable.at(layer) = trainable;
}

bool Parser::IsLayerTrainable(unsigned layer) const {
  return layer_trainable.at(layer);
}

const ParserConfig& Parser::Config() const {
  return config;
}

void Parser::Reseed(unsigned seed) {
  embedder->Reseed(seed);
}
