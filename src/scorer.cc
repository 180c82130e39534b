#include <stdexcept>
#include "scorer.h"

DeepBiaffineScorer::DeepBiaffineScorer(ParameterCollection& model, unsigned input_dim, unsigned hidden_dim, unsigned num_labels) :
    hidden_dim(hidden_dim), num_labels(num_labels), dropout_rate(0.0f), pcg(nullptr) {
  p_W1 = model.add_parameters({hidden_dim, input_dim});
  p_b1 = model.add_parameters({hidden_dim}, ParameterInitConst(0.0f));
  p_W2 = model.add_parameters({hidden_dim, input_dim});
  p_b2 = model.add_parameters({hidden_dim}, ParameterInitConst(0.0f));
  p_U = model.add_parameters({(hidden_dim + 1) * num_labels, hidden_dim + 1}, ParameterInitConst(0.0f));
}

void DeepBiaffineScorer::NewGraph(ComputationGraph& cg) {
  pcg = &cg;
  W1 = parameter(cg, p_W1);
  b1 = parameter(cg, p_b1);
  W2 = parameter(cg, p_W2);
  b2 = parameter(cg, p_b2);
  U = parameter(cg, p_U);
}

void DeepBiaffineScorer::SetDropout(float rate) {
  dropout_rate = rate;
}

// Appends a row of ones to a {D, T} matrix
Expression DeepBiaffineScorer::AppendBias(Expression x) {
  const Dim& d = x.dim();
  const unsigned T = d[1];
  Expression ones = input(*pcg, Dim({1, T}, d.bd), vector<float>(T * d.bd, 1.0f));
  return concatenate({x, ones});
}

Expression DeepBiaffineScorer::Score(Expression dependents, Expression heads) {
  Expression x1 = rectify(colwise_add(W1 * dependents, b1));
  Expression x2 = rectify(colwise_add(W2 * heads, b2));
  if (dropout_rate > 0.0f) {
    x1 = dropout(x1, dropout_rate);
    x2 = dropout(x2, dropout_rate);
  }
  x1 = AppendBias(x1);
  x2 = AppendBias(x2);

  const unsigned T = heads.dim()[1];
  // {(D+1) * L, T} -> {D+1, L * T}; column l + j * L is U_l x2_j
  Expression right = reshape(U * x2, Dim({hidden_dim + 1, num_labels * T}));
  return transpose(x1) * right;
}

MLPScorer::MLPScorer(ParameterCollection& model, unsigned input_dim, unsigned hidden_dim, unsigned num_labels) :
    dropout_rate(0.0f) {
  p_A = model.add_parameters({hidden_dim, input_dim});
  p_B = model.add_parameters({hidden_dim, input_dim});
  p_b = model.add_parameters({hidden_dim}, ParameterInitConst(0.0f));
  p_out_W = model.add_parameters({num_labels, hidden_dim});
  p_out_b = model.add_parameters({num_labels}, ParameterInitConst(0.0f));
}

void MLPScorer::NewGraph(ComputationGraph& cg) {
  A = parameter(cg, p_A);
  B = parameter(cg, p_B);
  b = parameter(cg, p_b);
  out_W = parameter(cg, p_out_W);
  out_b = parameter(cg, p_out_b);
}

void MLPScorer::SetDropout(float rate) {
  dropout_rate = rate;
}

Expression MLPScorer::Score(Expression dependents, Expression heads) {
  const unsigned T = heads.dim()[1];
  Expression dep_part = A * dependents;
  Expression head_part = colwise_add(B * heads, b);

  vector<Expression> columns(T);
  for (unsigned j = 0; j < T; ++j) {
    Expression hidden = tanh(colwise_add(dep_part, pick(head_part, j, 1)));
    if (dropout_rate > 0.0f) {
      hidden = dropout(hidden, dropout_rate);
    }
    // {L, T} -> {T, L}: the block of columns belonging to head j
    columns[j] = transpose(colwise_add(out_W * hidden, out_b));
  }
  return concatenate_cols(columns);
}

PairwiseScorer* CreatePairwiseScorer(ScorerType type, ParameterCollection& model, unsigned input_dim, unsigned hidden_dim, unsigned num_labels) {
  switch (type) {
    case kBiaffineScorer:
      return new DeepBiaffineScorer(model, input_dim, hidden_dim, num_labels);
    case kMlpScorer:
      return new MLPScorer(model, input_dim, hidden_dim, num_labels);
  }
  throw invalid_argument("Unknown scorer type");
}
