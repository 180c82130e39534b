#include <stdexcept>
#include "encoder.h"
#include "rnn_utils.h"

Expression GetParameter(ComputationGraph& cg, Parameter p, bool update) {
  return update ? parameter(cg, p) : const_parameter(cg, p);
}

vector<Expression> ConcatenateSteps(const vector<Expression>& a, const vector<Expression>& b) {
  vector<Expression> result(a.size());
  for (unsigned t = 0; t < a.size(); ++t) {
    result[t] = concatenate({a[t], b[t]});
  }
  return result;
}

vector<Expression> DropoutSteps(const vector<Expression>& xs, float rate) {
  if (rate <= 0.0f) {
    return xs;
  }
  vector<Expression> result(xs.size());
  for (unsigned t = 0; t < xs.size(); ++t) {
    result[t] = dropout(xs[t], rate);
  }
  return result;
}

HighwayLayer::HighwayLayer(ParameterCollection& model, unsigned input_dim, unsigned hidden_dim, bool learned_init) :
    hidden_dim(hidden_dim), learned_init(learned_init), rec_dropout(0.0f) {
  lstm = VanillaLSTMBuilder(1, input_dim, hidden_dim, model);
  p_gate_W = model.add_parameters({hidden_dim, input_dim});
  p_gate_b = model.add_parameters({hidden_dim}, ParameterInitConst(0.0f));
  p_high_W = model.add_parameters({hidden_dim, input_dim});
  p_high_b = model.add_parameters({hidden_dim}, ParameterInitConst(0.0f));
  if (learned_init) {
    p_init = model.add_parameters({hidden_dim}, ParameterInitConst(0.0f));
  }
}

void HighwayLayer::NewGraph(ComputationGraph& cg, bool update) {
  lstm.new_graph(cg, update);
  gate_W = GetParameter(cg, p_gate_W, update);
  gate_b = GetParameter(cg, p_gate_b, update);
  high_W = GetParameter(cg, p_high_W, update);
  high_b = GetParameter(cg, p_high_b, update);
  init.clear();
  if (learned_init) {
    init = MakeLSTMInitialState(GetParameter(cg, p_init, update), hidden_dim, 1);
  }
}

void HighwayLayer::SetDropout(float rate) {
  rec_dropout = rate;
  if (rate > 0.0f) {
    lstm.set_dropout(0.0f, rate);
  }
  else {
    lstm.disable_dropout();
  }
}

vector<Expression> HighwayLayer::Run(const vector<Expression>& inputs, unsigned batch_size) {
  lstm.start_new_sequence(init);
  if (rec_dropout > 0.0f) {
    lstm.set_dropout_masks(batch_size);
  }

  vector<Expression> outputs(inputs.size());
  for (unsigned t = 0; t < inputs.size(); ++t) {
    const Expression& x = inputs[t];
    Expression h = lstm.add_input(x);
    Expression gate = logistic(affine_transform({gate_b, gate_W, x}));
    Expression highway = tanh(affine_transform({high_b, high_W, x}));
    outputs[t] = h + cmult(gate, highway);
  }
  return outputs;
}

WeightDropLayer::WeightDropLayer(ParameterCollection& model, unsigned input_dim, unsigned hidden_dim) :
    hidden_dim(hidden_dim), weight_dropout(0.0f), pcg(nullptr) {
  p_Wx = model.add_parameters({4 * hidden_dim, input_dim});
  p_Wh = model.add_parameters({4 * hidden_dim, hidden_dim});
  p_b = model.add_parameters({4 * hidden_dim}, ParameterInitConst(0.0f));
}

void WeightDropLayer::NewGraph(ComputationGraph& cg, bool update) {
  pcg = &cg;
  Wx = GetParameter(cg, p_Wx, update);
  Wh = GetParameter(cg, p_Wh, update);
  b = GetParameter(cg, p_b, update);
}

void WeightDropLayer::SetDropout(float rate) {
  weight_dropout = rate;
}

vector<Expression> WeightDropLayer::Run(const vector<Expression>& inputs, unsigned batch_size) {
  // One mask over the recurrent weights for the whole sequence
  Expression W_rec = (weight_dropout > 0.0f) ? dropout(Wh, weight_dropout) : Wh;
  Expression h = zeros(*pcg, Dim({hidden_dim}, batch_size));
  Expression c = zeros(*pcg, Dim({hidden_dim}, batch_size));

  const unsigned H = hidden_dim;
  vector<Expression> outputs(inputs.size());
  for (unsigned t = 0; t < inputs.size(); ++t) {
    Expression gates = affine_transform({b, Wx, inputs[t], W_rec, h});
    Expression i = logistic(pickrange(gates, 0, H));
    Expression f = logistic(pickrange(gates, H, 2 * H));
    Expression o = logistic(pickrange(gates, 2 * H, 3 * H));
    Expression g = tanh(pickrange(gates, 3 * H, 4 * H));
    c = cmult(f, c) + cmult(i, g);
    h = cmult(o, tanh(c));
    outputs[t] = h;
  }
  return outputs;
}

BiHighwayEncoder::BiHighwayEncoder(vector<ParameterCollection>& layer_models, unsigned input_dim, unsigned hidden_dim) :
    hidden_dim(hidden_dim), dropout_rate(0.0f) {
  for (unsigned k = 0; k < layer_models.size(); ++k) {
    unsigned layer_input_dim = (k == 0) ? input_dim : 2 * hidden_dim;
    forward_layers.push_back(HighwayLayer(layer_models[k], layer_input_dim, hidden_dim, true));
    backward_layers.push_back(HighwayLayer(layer_models[k], layer_input_dim, hidden_dim, true));
  }
}

void BiHighwayEncoder::NewGraph(ComputationGraph& cg, const vector<bool>& trainable) {
  for (unsigned k = 0; k < forward_layers.size(); ++k) {
    forward_layers[k].NewGraph(cg, trainable[k]);
    backward_layers[k].NewGraph(cg, trainable[k]);
  }
}

void BiHighwayEncoder::SetDropout(float dropout, float rec_dropout) {
  dropout_rate = dropout;
  for (unsigned k = 0; k < forward_layers.size(); ++k) {
    forward_layers[k].SetDropout(rec_dropout);
    backward_layers[k].SetDropout(rec_dropout);
  }
}

unsigned BiHighwayEncoder::OutputDim() const {
  return 2 * hidden_dim;
}

vector<Expression> BiHighwayEncoder::Encode(const vector<Expression>& inputs, const vector<unsigned>& lengths) {
  const unsigned batch_size = lengths.size();
  vector<Expression> x = inputs;
  for (unsigned k = 0; k < forward_layers.size(); ++k) {
    if (k > 0) {
      x = DropoutSteps(x, dropout_rate);
    }
    vector<Expression> forward = forward_layers[k].Run(x, batch_size);
    vector<Expression> backward = backward_layers[k].Run(ReversePaddedSequence(x, lengths), batch_size);
    x = ConcatenateSteps(forward, ReversePaddedSequence(backward, lengths));
  }
  return x;
}

HighwayEncoder::HighwayEncoder(vector<ParameterCollection>& layer_models, unsigned input_dim, unsigned hidden_dim) :
    hidden_dim(hidden_dim), dropout_rate(0.0f) {
  for (unsigned k = 0; k < layer_models.size(); ++k) {
    unsigned layer_input_dim = (k == 0) ? input_dim : hidden_dim;
    forward_layers.push_back(HighwayLayer(layer_models[k], layer_input_dim, hidden_dim, false));
    backward_layers.push_back(HighwayLayer(layer_models[k], layer_input_dim, hidden_dim, false));
  }
}

void HighwayEncoder::NewGraph(ComputationGraph& cg, const vector<bool>& trainable) {
  for (unsigned k = 0; k < forward_layers.size(); ++k) {
    forward_layers[k].NewGraph(cg, trainable[k]);
    backward_layers[k].NewGraph(cg, trainable[k]);
  }
}

void HighwayEncoder::SetDropout(float dropout, float rec_dropout) {
  dropout_rate = dropout;
  for (unsigned k = 0; k < forward_layers.size(); ++k) {
    forward_layers[k].SetDropout(rec_dropout);
    backward_layers[k].SetDropout(rec_dropout);
  }
}

unsigned HighwayEncoder::OutputDim() const {
  return 2 * hidden_dim;
}

vector<Expression> HighwayEncoder::RunStack(vector<HighwayLayer>& layers, const vector<Expression>& inputs, unsigned batch_size) {
  vector<Expression> x = inputs;
  for (unsigned k = 0; k < layers.size(); ++k) {
    if (k > 0) {
      x = DropoutSteps(x, dropout_rate);
    }
    x = layers[k].Run(x, batch_size);
  }
  return x;
}

vector<Expression> HighwayEncoder::Encode(const vector<Expression>& inputs, const vector<unsigned>& lengths) {
  vector<Expression> forward = RunStack(forward_layers, inputs, lengths.size());
  vector<Expression> backward = RunStack(backward_layers, ReversePaddedSequence(inputs, lengths), lengths.size());
  return ConcatenateSteps(forward, ReversePaddedSequence(backward, lengths));
}

WeightDropEncoder::WeightDropEncoder(vector<ParameterCollection>& layer_models, unsigned input_dim, unsigned hidden_dim, unsigned output_dim) :
    output_dim(output_dim), dropout_rate(0.0f) {
  for (unsigned k = 0; k < layer_models.size(); ++k) {
    unsigned layer_input_dim = (k == 0) ? input_dim : hidden_dim;
    unsigned layer_output_dim = (k + 1 == layer_models.size()) ? output_dim : hidden_dim;
    forward_layers.push_back(WeightDropLayer(layer_models[k], layer_input_dim, layer_output_dim));
    backward_layers.push_back(WeightDropLayer(layer_models[k], layer_input_dim, layer_output_dim));
  }
}

void WeightDropEncoder::NewGraph(ComputationGraph& cg, const vector<bool>& trainable) {
  for (unsigned k = 0; k < forward_layers.size(); ++k) {
    forward_layers[k].NewGraph(cg, trainable[k]);
    backward_layers[k].NewGraph(cg, trainable[k]);
  }
}

void WeightDropEncoder::SetDropout(float dropout, float rec_dropout) {
  dropout_rate = dropout;
  for (unsigned k = 0; k < forward_layers.size(); ++k) {
    forward_layers[k].SetDropout(rec_dropout);
    backward_layers[k].SetDropout(rec_dropout);
  }
}

unsigned WeightDropEncoder::OutputDim() const {
  return 2 * output_dim;
}

vector<Expression> WeightDropEncoder::RunStack(vector<WeightDropLayer>& layers, const vector<Expression>& inputs, unsigned batch_size) {
  vector<Expression> x = inputs;
  for (unsigned k = 0; k < layers.size(); ++k) {
    if (k > 0) {
      x = DropoutSteps(x, dropout_rate);
    }
    x = layers[k].Run(x, batch_size);
  }
  return x;
}

vector<Expression> WeightDropEncoder::Encode(const vector<Expression>& inputs, const vector<unsigned>& lengths) {
  vector<Expression> forward = RunStack(forward_layers, inputs, lengths.size());
  vector<Expression> backward = RunStack(backward_layers, ReversePaddedSequence(inputs, lengths), lengths.size());
  return ConcatenateSteps(forward, ReversePaddedSequence(backward, lengths));
}

EncoderModel* CreateEncoderModel(const ParserConfig& config, vector<ParameterCollection>& layer_models, unsigned input_dim) {
  if (layer_models.size() != config.num_layers) {
    throw invalid_argument("Expected one parameter group per recurrent layer");
  }

  switch (config.lstm_type) {
    case kBiHighwayLstm:
      return new BiHighwayEncoder(layer_models, input_dim, config.hidden_dim);
    case kHighwayLstm:
      return new HighwayEncoder(layer_models, input_dim, config.hidden_dim);
    case kWeightDropLstm:
      return new WeightDropEncoder(layer_models, input_dim, config.hidden_dim, config.output_hidden_dim);
  }
  throw invalid_argument("Unknown recurrent encoder type");
}
