#pragma once
#include "dynet/dynet.h"
#include "dynet/expr.h"
#include "config.h"

using namespace std;
using namespace dynet;

// Scores every (dependent, head) pair of a sentence with num_labels values.
// Both inputs are {input_dim, T} matrices batched over sentences. The result
// is a {T, num_labels * T} matrix: entry (i, l + j * num_labels) is the score
// of label l for dependent i attaching to head j.
class PairwiseScorer {
public:
  virtual ~PairwiseScorer() {}

  virtual void NewGraph(ComputationGraph& cg) = 0;
  virtual void SetDropout(float rate) = 0;
  virtual Expression Score(Expression dependents, Expression heads) = 0;
};

// ReLU projections of both sides followed by a bilinear form with a bias
// feature appended to each side. The bilinear weights start at zero.
class DeepBiaffineScorer : public PairwiseScorer {
public:
  DeepBiaffineScorer(ParameterCollection& model, unsigned input_dim, unsigned hidden_dim, unsigned num_labels);

  void NewGraph(ComputationGraph& cg) override;
  void SetDropout(float rate) override;
  Expression Score(Expression dependents, Expression heads) override;

private:
  Expression AppendBias(Expression x);

  unsigned hidden_dim;
  unsigned num_labels;
  float dropout_rate;
  Parameter p_W1, p_b1;
  Parameter p_W2, p_b2;
  Parameter p_U;

  Expression W1, b1, W2, b2, U;
  ComputationGraph* pcg;
};

// tanh(A x_dep + B x_head + b) followed by a linear output layer
class MLPScorer : public PairwiseScorer {
public:
  MLPScorer(ParameterCollection& model, unsigned input_dim, unsigned hidden_dim, unsigned num_labels);

  void NewGraph(ComputationGraph& cg) override;
  void SetDropout(float rate) override;
  Expression Score(Expression dependents, Expression heads) override;

private:
  float dropout_rate;
  Parameter p_A, p_B, p_b;
  Parameter p_out_W, p_out_b;

  Expression A, B, b, out_W, out_b;
};

PairwiseScorer* CreatePairwiseScorer(ScorerType type, ParameterCollection& model, unsigned input_dim, unsigned hidden_dim, unsigned num_labels);
