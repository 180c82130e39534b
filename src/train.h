#pragma once
#include <boost/program_options.hpp>
#include "dynet/dynet.h"
#include "dynet/training.h"
#include "config.h"
#include "train_wrapper.h"

using namespace std;
using namespace dynet;
namespace po = boost::program_options;

void AddTrainerOptions(po::options_description& desc);
void AddParserOptions(po::options_description& desc);
void AddTrainingOptions(po::options_description& desc);

Trainer* CreateTrainer(ParameterCollection& model, const po::variables_map& vm, float learning_rate);
// Must be called before any parameter is added, so that every parameter
// group inherits the setting
void SetWeightDecay(ParameterCollection& model, float lambda);
ParserConfig CreateParserConfig(const po::variables_map& vm);
TrainingOptions CreateTrainingOptions(const po::variables_map& vm, unsigned num_layers);
