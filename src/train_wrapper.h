#pragma once
#include <vector>
#include "batch.h"
#include "learner.h"
#include "evaluator.h"
#include "parser.h"
#include "utils.h"

using namespace std;

enum StopReason {kRunning = 0, kMaxSteps = 1, kPatience = 2, kNoData = 3, kInterrupted = 4};
ostream& operator<<(ostream& out, const StopReason& reason);

struct TrainingOptions {
  TrainingOptions();

  unsigned max_steps;
  unsigned eval_interval;
  unsigned max_steps_before_stop;
  unsigned log_step;
  unsigned num_layers;
  // Global steps at which the next frozen recurrent layer is thawed, top layer first
  vector<unsigned> unfreeze_points;
  float learning_rate;
  float lr_shrink;
  float beta2;
};

struct TrainingState {
  TrainingState();

  unsigned step;
  float learning_rate;
  unsigned last_best_step;
  vector<float> dev_score_history;
  vector<SentencePrediction> best_dev_predictions;
  unsigned unfreeze_pointer;
  bool using_amsgrad;
  StopReason reason;
};

// Step-based training loop. Evaluates every eval_interval steps, saves the
// model whenever the dev score improves, switches to AMSGrad the first time
// max_steps_before_stop steps pass without improvement and stops the second
// time, or after max_steps steps.
class TrainingController {
public:
  TrainingController(BatchProvider& train_data, Evaluator& train_evaluator, Evaluator& dev_evaluator, Learner& learner, const TrainingOptions& options);

  StopReason Train();
  void Stop();
  const TrainingState& State() const;

private:
  void UnfreezeLayers();
  void RunStep(const Batch& batch);
  void Evaluate();
  void CheckPatience();
  void Report(const SufficientStats& stats, double seconds_elapsed);
  void Summarize() const;

  BatchProvider& train_data;
  Evaluator& train_evaluator;
  Evaluator& dev_evaluator;
  Learner& learner;
  TrainingOptions options;

  TrainingState state;
  SufficientStats log_stats;
  SufficientStats eval_stats;
  volatile bool stop;
};
