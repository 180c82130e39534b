#include <iostream>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "train_wrapper.h"

using namespace std;

ostream& operator<<(ostream& out, const StopReason& reason) {
  switch (reason) {
    case kRunning:
      return out << "running";
    case kMaxSteps:
      return out << "max steps reached";
    case kPatience:
      return out << "no improvement on dev";
    case kNoData:
      return out << "no data";
    case kInterrupted:
      return out << "interrupted";
  }
  return out << "unknown";
}

TrainingOptions::TrainingOptions() :
  max_steps(50000), eval_interval(100), max_steps_before_stop(6000), log_step(20), num_layers(3),
  learning_rate(3e-3f), lr_shrink(1.0f / 2.6f), beta2(0.999f) {}

TrainingState::TrainingState() :
  step(0), learning_rate(0.0f), last_best_step(0), unfreeze_pointer(0), using_amsgrad(false), reason(kRunning) {}

TrainingController::TrainingController(BatchProvider& train_data, Evaluator& train_evaluator, Evaluator& dev_evaluator, Learner& learner, const TrainingOptions& options) :
    train_data(train_data), train_evaluator(train_evaluator), dev_evaluator(dev_evaluator), learner(learner), options(options), stop(false) {
  if (options.eval_interval == 0 || options.log_step == 0) {
    throw invalid_argument("eval_interval and log_step must be positive");
  }
  if (options.unfreeze_points.size() > options.num_layers) {
    throw invalid_argument("More unfreeze points than recurrent layers");
  }
  state.learning_rate = options.learning_rate;
}

StopReason TrainingController::Train() {
  if (train_data.size() == 0 || !dev_evaluator.HasData()) {
    cerr << "Skipping training because no training or dev data is available" << endl;
    state.reason = kNoData;
    return state.reason;
  }

  cerr << "Training parser..." << endl;
  while (state.reason == kRunning) {
    for (unsigned i = 0; i < train_data.size() && state.reason == kRunning; ++i) {
      RunStep(train_data[i]);
    }
    if (state.reason == kRunning) {
      train_data.Reshuffle();
    }
  }

  Summarize();
  return state.reason;
}

void TrainingController::Stop() {
  stop = true;
}

const TrainingState& TrainingController::State() const {
  return state;
}

void TrainingController::UnfreezeLayers() {
  const vector<unsigned>& points = options.unfreeze_points;
  while (state.unfreeze_pointer < points.size() && state.step == points[state.unfreeze_pointer]) {
    const unsigned p = state.unfreeze_pointer;
    const float learning_rate = options.learning_rate * pow(options.lr_shrink, (float)(p + 1));
    learner.Unfreeze(options.num_layers - 1 - p, learning_rate);
    state.unfreeze_pointer++;
  }
}

void TrainingController::RunStep(const Batch& batch) {
  UnfreezeLayers();

  time_point start_time = GetTime();
  state.step++;
  SufficientStats stats = learner.Update(batch);
  time_point end_time = GetTime();
  log_stats += stats;
  eval_stats += stats;

  if (state.step % options.log_step == 0) {
    Report(log_stats, GetSeconds(start_time, end_time));
    log_stats = SufficientStats();
  }

  if (state.step % options.eval_interval == 0) {
    Evaluate();
  }

  CheckPatience();
  if (state.reason == kRunning && state.step >= options.max_steps) {
    state.reason = kMaxSteps;
  }
  if (state.reason == kRunning && stop) {
    state.reason = kInterrupted;
  }
}

void TrainingController::Evaluate() {
  float train_score = 0.0f;
  if (train_evaluator.HasData()) {
    train_score = train_evaluator.Evaluate(learner).score;
  }

  cerr << "Evaluating on dev set..." << endl;
  EvaluationResult dev = dev_evaluator.Evaluate(learner);
  cerr << "step " << state.step << ": train_loss = " << eval_stats.AverageLoss() << ", train_score = " << train_score << ", dev_score = " << dev.score << endl;
  eval_stats = SufficientStats();

  const vector<float>& history = state.dev_score_history;
  if (history.empty() || dev.score > *max_element(history.begin(), history.end())) {
    state.last_best_step = state.step;
    learner.SaveModel();
    cerr << "new best model saved." << endl;
    state.best_dev_predictions = dev.predictions;
  }
  state.dev_score_history.push_back(dev.score);
}

void TrainingController::CheckPatience() {
  if (state.step - state.last_best_step < options.max_steps_before_stop) {
    return;
  }

  if (!state.using_amsgrad) {
    cerr << "Switching to AMSGrad" << endl;
    state.last_best_step = state.step;
    state.using_amsgrad = true;
    learner.SwitchToAmsgrad(options.learning_rate, 0.9f, options.beta2, 1e-6f);
  }
  else {
    state.reason = kPatience;
  }
}

void TrainingController::Report(const SufficientStats& stats, double seconds_elapsed) {
  cerr << "step " << state.step << "/" << options.max_steps << ", loss = " << stats.loss / options.log_step << " (" << seconds_elapsed << " sec/batch), lr: " << state.learning_rate << endl;
}

void TrainingController::Summarize() const {
  cerr << "Training ended with " << state.step << " steps (" << state.reason << ")." << endl;
  const vector<float>& history = state.dev_score_history;
  if (history.empty()) {
    return;
  }

  auto best = max_element(history.begin(), history.end());
  unsigned best_step = (best - history.begin() + 1) * options.eval_interval;
  cerr << "Best dev LAS = " << *best * 100.0f << ", at step " << best_step << endl;
}
