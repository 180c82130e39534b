#include <vector>
#include <algorithm>
#include <stdexcept>
#include "train_wrapper.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE train_wrapper_test

#include <boost/test/unit_test.hpp>

using namespace std;

class FakeBatches : public BatchProvider {
public:
  explicit FakeBatches(unsigned count) : batches(count), reshuffles(0) {}

  unsigned size() const override { return batches.size(); }
  const Batch& operator[](unsigned i) const override { return batches[i]; }
  void Reshuffle() override { reshuffles++; }

  vector<Batch> batches;
  unsigned reshuffles;
};

struct UnfreezeCall {
  unsigned layer;
  float learning_rate;
  unsigned updates_before;
};

class FakeLearner : public Learner {
public:
  FakeLearner() : updates(0), saves(0), amsgrad_switches(0), amsgrad_learning_rate(0.0f), amsgrad_beta2(0.0f) {}

  SufficientStats Update(const Batch& batch) override {
    updates++;
    return SufficientStats(1.0f, 10, 1);
  }

  vector<SentencePrediction> Predict(const Batch& batch) override {
    return vector<SentencePrediction>();
  }

  void SaveModel() override { saves++; }

  void Unfreeze(unsigned layer, float learning_rate) override {
    UnfreezeCall call = {layer, learning_rate, updates};
    unfreezes.push_back(call);
  }

  void SwitchToAmsgrad(float learning_rate, float beta1, float beta2, float epsilon) override {
    amsgrad_switches++;
    amsgrad_learning_rate = learning_rate;
    amsgrad_beta2 = beta2;
  }

  unsigned updates;
  unsigned saves;
  unsigned amsgrad_switches;
  float amsgrad_learning_rate;
  float amsgrad_beta2;
  vector<UnfreezeCall> unfreezes;
};

// Returns the given scores in order, repeating the last one
class FakeEvaluator : public Evaluator {
public:
  FakeEvaluator(bool has_data, const vector<float>& scores) : has_data(has_data), scores(scores), calls(0) {}

  bool HasData() const override { return has_data; }

  EvaluationResult Evaluate(Learner& learner) override {
    EvaluationResult result;
    result.score = scores.empty() ? 0.0f : scores[min<unsigned>(calls, scores.size() - 1)];
    calls++;
    return result;
  }

  bool has_data;
  vector<float> scores;
  unsigned calls;
};

TrainingOptions SmallOptions() {
  TrainingOptions options;
  options.max_steps = 5;
  options.eval_interval = 100;
  options.max_steps_before_stop = 1000;
  options.log_step = 2;
  options.num_layers = 3;
  options.learning_rate = 1.0f;
  options.lr_shrink = 0.5f;
  return options;
}

BOOST_AUTO_TEST_CASE(single_step)
{
  FakeBatches batches(3);
  FakeLearner learner;
  FakeEvaluator train_eval(false, {});
  FakeEvaluator dev_eval(true, {0.5f});

  TrainingOptions options = SmallOptions();
  options.max_steps = 1;
  options.eval_interval = 2;
  TrainingController controller(batches, train_eval, dev_eval, learner, options);

  BOOST_CHECK_EQUAL(kMaxSteps, controller.Train());
  BOOST_CHECK_EQUAL(1u, learner.updates);
  BOOST_CHECK_EQUAL(0u, dev_eval.calls);
  BOOST_CHECK_EQUAL(0u, learner.saves);
  BOOST_CHECK_EQUAL(1u, controller.State().step);
}

BOOST_AUTO_TEST_CASE(reshuffle_every_epoch)
{
  FakeBatches batches(2);
  FakeLearner learner;
  FakeEvaluator train_eval(false, {});
  FakeEvaluator dev_eval(true, {0.5f});
  TrainingController controller(batches, train_eval, dev_eval, learner, SmallOptions());

  BOOST_CHECK_EQUAL(kMaxSteps, controller.Train());
  BOOST_CHECK_EQUAL(5u, learner.updates);
  BOOST_CHECK_EQUAL(2u, batches.reshuffles);
}

BOOST_AUTO_TEST_CASE(saves_on_improvement)
{
  FakeBatches batches(4);
  FakeLearner learner;
  FakeEvaluator train_eval(true, {0.9f});
  FakeEvaluator dev_eval(true, {0.3f, 0.2f, 0.4f, 0.4f, 0.1f});

  TrainingOptions options = SmallOptions();
  options.eval_interval = 1;
  TrainingController controller(batches, train_eval, dev_eval, learner, options);

  BOOST_CHECK_EQUAL(kMaxSteps, controller.Train());
  BOOST_CHECK_EQUAL(5u, dev_eval.calls);
  BOOST_CHECK_EQUAL(5u, train_eval.calls);
  // the first evaluation always saves, then only strict improvements do
  BOOST_CHECK_EQUAL(2u, learner.saves);
  BOOST_CHECK_EQUAL(3u, controller.State().last_best_step);
  BOOST_CHECK_EQUAL(5u, controller.State().dev_score_history.size());
}

BOOST_AUTO_TEST_CASE(patience_switches_once_then_stops)
{
  FakeBatches batches(4);
  FakeLearner learner;
  FakeEvaluator train_eval(false, {});
  FakeEvaluator dev_eval(true, {0.5f});

  TrainingOptions options = SmallOptions();
  options.max_steps = 1000;
  options.eval_interval = 1;
  options.max_steps_before_stop = 3;
  options.learning_rate = 0.003f;
  options.beta2 = 0.95f;
  TrainingController controller(batches, train_eval, dev_eval, learner, options);

  BOOST_CHECK_EQUAL(kPatience, controller.Train());
  // best at step 1, switch at step 4, stop at step 7
  BOOST_CHECK_EQUAL(7u, learner.updates);
  BOOST_CHECK_EQUAL(1u, learner.amsgrad_switches);
  BOOST_CHECK_EQUAL(1u, learner.saves);
  BOOST_CHECK_CLOSE(0.003f, learner.amsgrad_learning_rate, 1e-4);
  BOOST_CHECK_CLOSE(0.95f, learner.amsgrad_beta2, 1e-4);
  BOOST_CHECK(controller.State().using_amsgrad);
}

BOOST_AUTO_TEST_CASE(unfreeze_schedule)
{
  FakeBatches batches(3);
  FakeLearner learner;
  FakeEvaluator train_eval(false, {});
  FakeEvaluator dev_eval(true, {0.5f});

  TrainingOptions options = SmallOptions();
  options.unfreeze_points = {0, 2};
  TrainingController controller(batches, train_eval, dev_eval, learner, options);
  controller.Train();

  BOOST_REQUIRE_EQUAL(2u, learner.unfreezes.size());
  BOOST_CHECK_EQUAL(2u, learner.unfreezes[0].layer);
  BOOST_CHECK_CLOSE(0.5f, learner.unfreezes[0].learning_rate, 1e-4);
  BOOST_CHECK_EQUAL(0u, learner.unfreezes[0].updates_before);
  BOOST_CHECK_EQUAL(1u, learner.unfreezes[1].layer);
  BOOST_CHECK_CLOSE(0.25f, learner.unfreezes[1].learning_rate, 1e-4);
  BOOST_CHECK_EQUAL(2u, learner.unfreezes[1].updates_before);
  BOOST_CHECK_EQUAL(2u, controller.State().unfreeze_pointer);
}

BOOST_AUTO_TEST_CASE(no_training_data)
{
  FakeBatches batches(0);
  FakeLearner learner;
  FakeEvaluator train_eval(false, {});
  FakeEvaluator dev_eval(true, {0.5f});
  TrainingController controller(batches, train_eval, dev_eval, learner, SmallOptions());

  BOOST_CHECK_EQUAL(kNoData, controller.Train());
  BOOST_CHECK_EQUAL(0u, learner.updates);
  BOOST_CHECK_EQUAL(0u, dev_eval.calls);
}

BOOST_AUTO_TEST_CASE(no_dev_data)
{
  FakeBatches batches(2);
  FakeLearner learner;
  FakeEvaluator train_eval(false, {});
  FakeEvaluator dev_eval(false, {});
  TrainingController controller(batches, train_eval, dev_eval, learner, SmallOptions());

  BOOST_CHECK_EQUAL(kNoData, controller.Train());
  BOOST_CHECK_EQUAL(0u, learner.updates);
}

BOOST_AUTO_TEST_CASE(interrupted)
{
  FakeBatches batches(2);
  FakeLearner learner;
  FakeEvaluator train_eval(false, {});
  FakeEvaluator dev_eval(true, {0.5f});
  TrainingController controller(batches, train_eval, dev_eval, learner, SmallOptions());

  controller.Stop();
  BOOST_CHECK_EQUAL(kInterrupted, controller.Train());
  BOOST_CHECK_EQUAL(1u, learner.updates);
}

BOOST_AUTO_TEST_CASE(bad_options)
{
  FakeBatches batches(2);
  FakeLearner learner;
  FakeEvaluator train_eval(false, {});
  FakeEvaluator dev_eval(true, {0.5f});

  TrainingOptions options = SmallOptions();
  options.eval_interval = 0;
  BOOST_CHECK_THROW(TrainingController(batches, train_eval, dev_eval, learner, options), invalid_argument);

  options = SmallOptions();
  options.unfreeze_points = {0, 1, 2, 3};
  BOOST_CHECK_THROW(TrainingController(batches, train_eval, dev_eval, learner, options), invalid_argument);
}

BOOST_AUTO_TEST_CASE(sufficient_stats)
{
  SufficientStats stats = SufficientStats(2.0f, 10, 1) + SufficientStats(4.0f, 6, 1);
  BOOST_CHECK_EQUAL(16u, stats.word_count);
  BOOST_CHECK_CLOSE(3.0f, stats.AverageLoss(), 1e-4);
  BOOST_CHECK_EQUAL(0.0f, SufficientStats().AverageLoss());
}
