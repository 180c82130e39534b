#pragma once
#include <vector>
#include "dynet/dynet.h"
#include "dynet/lstm.h"
#include "dynet/expr.h"
#include "utils.h"
#include "config.h"

using namespace std;
using namespace dynet;

// Turns the fused token vectors of a padded batch into contextual vectors.
// inputs[t] holds time step t of every sentence; lengths are the true
// sentence lengths. Layer k of an encoder keeps its parameters in
// layer_models[k] so that each depth can be frozen on its own.
class EncoderModel {
public:
  virtual ~EncoderModel() {}

  // trainable[k] == false makes layer k constant in this graph
  virtual void NewGraph(ComputationGraph& cg, const vector<bool>& trainable) = 0;
  virtual void SetDropout(float dropout, float rec_dropout) = 0;
  virtual unsigned OutputDim() const = 0;
  virtual vector<Expression> Encode(const vector<Expression>& inputs, const vector<unsigned>& lengths) = 0;
};

// A single-layer LSTM plus a highway connection from its input:
// h = lstm(x) + sigmoid(W_g x + b_g) * tanh(W_h x + b_h)
class HighwayLayer {
public:
  HighwayLayer(ParameterCollection& model, unsigned input_dim, unsigned hidden_dim, bool learned_init);

  void NewGraph(ComputationGraph& cg, bool update);
  void SetDropout(float rec_dropout);
  vector<Expression> Run(const vector<Expression>& inputs, unsigned batch_size);

private:
  unsigned hidden_dim;
  bool learned_init;
  float rec_dropout;
  VanillaLSTMBuilder lstm;
  Parameter p_gate_W, p_gate_b;
  Parameter p_high_W, p_high_b;
  Parameter p_init;

  Expression gate_W, gate_b;
  Expression high_W, high_b;
  vector<Expression> init;
};

// An LSTM layer whose hidden-to-hidden weights are dropped out once per
// sequence instead of dropping the recurrent activations.
class WeightDropLayer {
public:
  WeightDropLayer(ParameterCollection& model, unsigned input_dim, unsigned hidden_dim);

  void NewGraph(ComputationGraph& cg, bool update);
  void SetDropout(float weight_dropout);
  vector<Expression> Run(const vector<Expression>& inputs, unsigned batch_size);

private:
  unsigned hidden_dim;
  float weight_dropout;
  Parameter p_Wx, p_Wh, p_b;
  Expression Wx, Wh, b;
  ComputationGraph* pcg;
};

// bihlstm: at every depth a forward and a backward highway layer read the
// previous depth's concatenated output
class BiHighwayEncoder : public EncoderModel {
public:
  BiHighwayEncoder(vector<ParameterCollection>& layer_models, unsigned input_dim, unsigned hidden_dim);

  void NewGraph(ComputationGraph& cg, const vector<bool>& trainable) override;
  void SetDropout(float dropout, float rec_dropout) override;
  unsigned OutputDim() const override;
  vector<Expression> Encode(const vector<Expression>& inputs, const vector<unsigned>& lengths) override;

private:
  unsigned hidden_dim;
  float dropout_rate;
  vector<HighwayLayer> forward_layers;
  vector<HighwayLayer> backward_layers;
};

// hlstm: two independent unidirectional highway stacks, the backward one
// reading the length-reversed input
class HighwayEncoder : public EncoderModel {
public:
  HighwayEncoder(vector<ParameterCollection>& layer_models, unsigned input_dim, unsigned hidden_dim);

  void NewGraph(ComputationGraph& cg, const vector<bool>& trainable) override;
  void SetDropout(float dropout, float rec_dropout) override;
  unsigned OutputDim() const override;
  vector<Expression> Encode(const vector<Expression>& inputs, const vector<unsigned>& lengths) override;

private:
  vector<Expression> RunStack(vector<HighwayLayer>& layers, const vector<Expression>& inputs, unsigned batch_size);

  unsigned hidden_dim;
  float dropout_rate;
  vector<HighwayLayer> forward_layers;
  vector<HighwayLayer> backward_layers;
};

// wdlstm: like hlstm but with weight-dropped layers and no highway
// connections. The top layer has width output_dim.
class WeightDropEncoder : public EncoderModel {
public:
  WeightDropEncoder(vector<ParameterCollection>& layer_models, unsigned input_dim, unsigned hidden_dim, unsigned output_dim);

  void NewGraph(ComputationGraph& cg, const vector<bool>& trainable) override;
  void SetDropout(float dropout, float rec_dropout) override;
  unsigned OutputDim() const override;
  vector<Expression> Encode(const vector<Expression>& inputs, const vector<unsigned>& lengths) override;

private:
  vector<Expression> RunStack(vector<WeightDropLayer>& layers, const vector<Expression>& inputs, unsigned batch_size);

  unsigned output_dim;
  float dropout_rate;
  vector<WeightDropLayer> forward_layers;
  vector<WeightDropLayer> backward_layers;
};

EncoderModel* CreateEncoderModel(const ParserConfig& config, vector<ParameterCollection>& layer_models, unsigned input_dim);
