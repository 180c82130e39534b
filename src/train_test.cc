#include <vector>
#include <string>
#include <stdexcept>
#include "dynet/dynet.h"
#include "dynet/init.h"
#include "train.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE train_test

#include <boost/test/unit_test.hpp>

using namespace std;
using namespace dynet;

struct DynetSetup {
  DynetSetup() {
    DynetParams params;
    params.random_seed = 1;
    dynet::initialize(params);
  }
  ~DynetSetup() {
    dynet::cleanup();
  }
};
BOOST_GLOBAL_FIXTURE(DynetSetup);

po::variables_map ParseArgs(const vector<string>& args) {
  po::options_description desc;
  AddTrainerOptions(desc);
  AddParserOptions(desc);
  AddTrainingOptions(desc);
  po::variables_map vm;
  po::store(po::command_line_parser(args).options(desc).run(), vm);
  po::notify(vm);
  return vm;
}

BOOST_AUTO_TEST_CASE(defaults)
{
  po::variables_map vm = ParseArgs({});
  BOOST_CHECK_CLOSE(1e-6f, vm["wdecay"].as<float>(), 1e-3);
  BOOST_CHECK_CLOSE(1.0f, vm["max_grad_norm"].as<float>(), 1e-3);

  ParserConfig config = CreateParserConfig(vm);
  BOOST_CHECK_EQUAL(75u, config.word_emb_dim);
  BOOST_CHECK_EQUAL(75u, config.lemma_emb_dim);
}

BOOST_AUTO_TEST_CASE(weight_decay)
{
  po::variables_map vm = ParseArgs({"--wdecay", "0.001"});
  ParameterCollection model;
  SetWeightDecay(model, vm["wdecay"].as<float>());
  BOOST_CHECK_CLOSE(0.001f, model.get_weight_decay_lambda(), 1e-3);

  ParameterCollection other;
  BOOST_CHECK_THROW(SetWeightDecay(other, -1.0f), invalid_argument);
}

BOOST_AUTO_TEST_CASE(one_learner_only)
{
  ParameterCollection model;
  model.add_parameters({2});

  po::variables_map vm = ParseArgs({"--sgd", "--adam"});
  BOOST_CHECK_THROW(CreateTrainer(model, vm, 0.1f), invalid_argument);

  vm = ParseArgs({"--sgd"});
  Trainer* trainer = CreateTrainer(model, vm, 0.1f);
  BOOST_CHECK(trainer != nullptr);
  BOOST_CHECK_CLOSE(0.1f, trainer->learning_rate, 1e-3);
  delete trainer;
}
