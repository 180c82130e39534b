#pragma once
#include <vector>
#include <memory>
#include <functional>
#include <iostream>
#include "dynet/dynet.h"
#include "dynet/training.h"
#include "batch.h"
#include "parser.h"

using namespace std;
using namespace dynet;

class MultiVocab;

class SufficientStats {
public:
  dynet::real loss;
  unsigned word_count;
  unsigned batch_count;

  SufficientStats();
  SufficientStats(dynet::real loss, unsigned word_count, unsigned batch_count);
  SufficientStats& operator+=(const SufficientStats& rhs);
  SufficientStats operator+(const SufficientStats& rhs) const;
  // Mean loss per batch
  dynet::real AverageLoss() const;
};
std::ostream& operator<< (std::ostream& stream, const SufficientStats& stats);

// What the training loop needs from a model
class Learner {
public:
  virtual ~Learner() {}

  virtual SufficientStats Update(const Batch& batch) = 0;
  virtual vector<SentencePrediction> Predict(const Batch& batch) = 0;
  virtual void SaveModel() = 0;
  virtual void Unfreeze(unsigned layer, float learning_rate) = 0;
  virtual void SwitchToAmsgrad(float learning_rate, float beta1, float beta2, float epsilon) = 0;
};

// Rescales every gradient of the model so that their joint L2 norm is at
// most max_norm. Returns the norm before rescaling.
float ClipGradients(ParameterCollection& model, float max_norm);

typedef function<Trainer*(ParameterCollection& model, float learning_rate)> TrainerFactory;

// Trains a Parser with one DyNet trainer per parameter group. Gradients are
// clipped once by their joint norm over the whole model. Recurrent
// layers that are frozen have no trainer until they are unfrozen.
class ParserLearner : public Learner {
public:
  ParserLearner(Parser& parser, ParameterCollection& model, const MultiVocab& vocab, TrainerFactory create_trainer, float learning_rate, float max_grad_norm, bool start_frozen, const string& model_filename);

  SufficientStats Update(const Batch& batch) override;
  vector<SentencePrediction> Predict(const Batch& batch) override;
  void SaveModel() override;
  void Unfreeze(unsigned layer, float learning_rate) override;
  void SwitchToAmsgrad(float learning_rate, float beta1, float beta2, float epsilon) override;

private:
  void AddTrainer(ParameterCollection& group, float learning_rate);

  Parser& parser;
  ParameterCollection& model;
  const MultiVocab& vocab;
  TrainerFactory create_trainer;
  float max_grad_norm;
  string model_filename;

  bool using_amsgrad;
  float amsgrad_beta1, amsgrad_beta2, amsgrad_epsilon;

  // trainers[g] belongs to groups[g]
  vector<ParameterCollection*> groups;
  vector<unique_ptr<Trainer>> trainers;
};
