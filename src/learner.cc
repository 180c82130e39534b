#include "learner.h"
#include "vocab.h"
#include "io.h"

SufficientStats::SufficientStats() : loss(), word_count(), batch_count() {}

SufficientStats::SufficientStats(dynet::real loss, unsigned word_count, unsigned batch_count) : loss(loss), word_count(word_count), batch_count(batch_count) {}

SufficientStats& SufficientStats::operator+=(const SufficientStats& rhs) {
  loss += rhs.loss;
  word_count += rhs.word_count;
  batch_count += rhs.batch_count;
  return *this;
}

SufficientStats SufficientStats::operator+(const SufficientStats& rhs) const {
  SufficientStats result = *this;
  result += rhs;
  return result;
}

dynet::real SufficientStats::AverageLoss() const {
  return (batch_count > 0) ? loss / batch_count : 0.0f;
}

std::ostream& operator<< (std::ostream& stream, const SufficientStats& stats) {
  return stream << stats.AverageLoss() << " (" << stats.word_count << " words in " << stats.batch_count << " batches)";
}

float ClipGradients(ParameterCollection& model, float max_norm) {
  const float norm = model.gradient_l2_norm();
  if (norm > max_norm) {
    const float scale = max_norm / norm;
    for (const auto& p : model.parameters_list()) {
      p->scale_gradient(scale);
    }
    for (const auto& p : model.lookup_parameters_list()) {
      p->scale_gradient(scale);
    }
  }
  return norm;
}

ParserLearner::ParserLearner(Parser& parser, ParameterCollection& model, const MultiVocab& vocab, TrainerFactory create_trainer, float learning_rate, float max_grad_norm, bool start_frozen, const string& model_filename) :
    parser(parser), model(model), vocab(vocab), create_trainer(create_trainer), max_grad_norm(max_grad_norm), model_filename(model_filename),
    using_amsgrad(false), amsgrad_beta1(0.9f), amsgrad_beta2(0.999f), amsgrad_epsilon(1e-6f) {
  AddTrainer(parser.FeatureGroup(), learning_rate);
  for (unsigned k = 0; k < parser.NumLayers(); ++k) {
    parser.SetLayerTrainable(k, !start_frozen);
    if (!start_frozen) {
      AddTrainer(parser.LayerGroup(k), learning_rate);
    }
  }
  AddTrainer(parser.ScorerGroup(), learning_rate);
}

void ParserLearner::AddTrainer(ParameterCollection& group, float learning_rate) {
  Trainer* trainer = nullptr;
  if (using_amsgrad) {
    trainer = new AmsgradTrainer(group, learning_rate, amsgrad_beta1, amsgrad_beta2, amsgrad_epsilon);
  }
  else {
    trainer = create_trainer(group, learning_rate);
  }
  // Clipping is done once over the whole model in Update()
  trainer->clipping_enabled = false;
  groups.push_back(&group);
  trainers.push_back(unique_ptr<Trainer>(trainer));
}

SufficientStats ParserLearner::Update(const Batch& batch) {
  ComputationGraph cg;
  ForwardResult result = parser.Forward(batch, cg, true);
  dynet::real loss = as_scalar(cg.forward(result.loss));

  if (batch.NumWords() > 0) {
    cg.backward(result.loss);
    if (max_grad_norm > 0.0f) {
      ClipGradients(model, max_grad_norm);
    }
    for (unique_ptr<Trainer>& trainer : trainers) {
      trainer->update();
    }
  }
  return SufficientStats(loss, batch.NumWords(), 1);
}

vector<SentencePrediction> ParserLearner::Predict(const Batch& batch) {
  ComputationGraph cg;
  ForwardResult result = parser.Forward(batch, cg, false);
  return result.predictions;
}

void ParserLearner::SaveModel() {
  Serialize(model_filename, parser.Config(), vocab, model);
}

void ParserLearner::Unfreeze(unsigned layer, float learning_rate) {
  if (parser.IsLayerTrainable(layer)) {
    return;
  }
  cerr << "Unfreezing recurrent layer " << layer << " with learning rate " << learning_rate << endl;
  parser.SetLayerTrainable(layer, true);
  AddTrainer(parser.LayerGroup(layer), learning_rate);
}

void ParserLearner::SwitchToAmsgrad(float learning_rate, float beta1, float beta2, float epsilon) {
  using_amsgrad = true;
  amsgrad_beta1 = beta1;
  amsgrad_beta2 = beta2;
  amsgrad_epsilon = epsilon;

  vector<ParameterCollection*> active_groups = groups;
  groups.clear();
  trainers.clear();
  for (ParameterCollection* group : active_groups) {
    AddTrainer(*group, learning_rate);
  }
}
