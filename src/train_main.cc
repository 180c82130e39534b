#include <iostream>
#include <memory>
#include <csignal>
#include <stdexcept>
#include <boost/program_options.hpp>
#include "dynet/dynet.h"
#include "dynet/init.h"
#include "conll.h"
#include "vocab.h"
#include "pretrain.h"
#include "batch.h"
#include "parser.h"
#include "learner.h"
#include "evaluator.h"
#include "train.h"
#include "train_wrapper.h"
#include "io.h"

using namespace dynet;
using namespace std;
namespace po = boost::program_options;

TrainingController* controller = nullptr;

int main(int argc, char** argv) {
  cerr << "Invoked as:";
  for (int i = 0; i < argc; ++i) {
    cerr << " " << argv[i];
  }
  cerr << "\n";

  DynetParams dynet_params = extract_dynet_params(argc, argv);

  po::options_description desc("description");
  desc.add_options()
  ("help", "Display this help message")

  ("train_file", po::value<string>()->required(), "Training set in CoNLL-U format")
  ("eval_file", po::value<string>()->required(), "Dev set in CoNLL-U format")
  ("gold_file", po::value<string>(), "Gold annotation of the dev set. Defaults to eval_file")
  ("output_file", po::value<string>()->default_value("dev.pred.conllu"), "Where predictions are written during evaluation")
  ("model", po::value<string>()->default_value("parser.model"), "Where the best model is saved")
  ("pretrained", po::value<string>(), "Pretrained word vectors in word2vec text format")
  ("pretrain_max_vocab", po::value<unsigned>()->default_value(0), "Read at most this many pretrained vectors. 0 reads all")
  ("init_model", po::value<string>(), "Start from the input features and recurrent layers of this model. Its vocabulary and architecture are reused, and the recurrent layers stay frozen until unfrozen by --unfreeze_points");

  AddParserOptions(desc);
  AddTrainingOptions(desc);
  AddTrainerOptions(desc);

  po::positional_options_description positional_options;
  positional_options.add("train_file", 1);
  positional_options.add("eval_file", 1);

  try {
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional_options).run(), vm);

    if (vm.count("help")) {
      cerr << desc;
      return 1;
    }

    po::notify(vm);

    dynet_params.random_seed = vm["seed"].as<unsigned>();
    dynet::initialize(dynet_params);

    const string train_file = vm["train_file"].as<string>();
    const string eval_file = vm["eval_file"].as<string>();
    const string gold_file = vm.count("gold_file") ? vm["gold_file"].as<string>() : eval_file;
    const string output_file = vm["output_file"].as<string>();
    const string model_file = vm["model"].as<string>();

    ParserConfig config = CreateParserConfig(vm);

    ConllDocument train_document = ConllDocument::ReadFile(train_file);
    ConllDocument dev_document = ConllDocument::ReadFile(eval_file);

    unique_ptr<Checkpoint> init_checkpoint;
    MultiVocab vocab;
    if (vm.count("init_model")) {
      init_checkpoint.reset(new Checkpoint(Deserialize(vm["init_model"].as<string>())));
      const ParserConfig command_line_config = config;
      config = init_checkpoint->config;
      config.word_dropout = command_line_config.word_dropout;
      config.dropout = command_line_config.dropout;
      config.rec_dropout = command_line_config.rec_dropout;
      vocab = init_checkpoint->vocab;
      cerr << "Initializing from " << vm["init_model"].as<string>() << endl;
    }
    else {
      vocab = MultiVocab(train_document, config.vocab_cutoff, config.xpos_separator);
    }
    cerr << "Read " << train_document.NumSentences() << " training sentences and " << dev_document.NumSentences() << " dev sentences" << endl;
    cerr << "Vocabulary sizes: " << vocab.word.size() << " words, " << vocab.lemma.size() << " lemmas, " << vocab.chars.size() << " characters, " << vocab.deprel.size() << " relations" << endl;

    unique_ptr<Pretrain> pretrain;
    if (init_checkpoint && config.pretrain_dim > 0) {
      if (!vm.count("pretrained")) {
        throw invalid_argument("The initial model was trained with pretrained vectors; please pass them with --pretrained");
      }
      pretrain.reset(new Pretrain(vm["pretrained"].as<string>(), vm["pretrain_max_vocab"].as<unsigned>()));
      if (pretrain->Dim() != config.pretrain_dim) {
        throw invalid_argument("The pretrained vectors do not have the dimension the initial model was trained with");
      }
    }
    else if (!init_checkpoint && vm.count("pretrained") && !vm.count("no_pretrain")) {
      pretrain.reset(new Pretrain(vm["pretrained"].as<string>(), vm["pretrain_max_vocab"].as<unsigned>()));
      config.pretrain_dim = pretrain->Dim();
    }

    const unsigned batch_size = vm["batch_size"].as<unsigned>();
    DataLoader train_data(train_document, vocab, pretrain.get(), batch_size, true, vm["sample_train"].as<float>());
    DataLoader train_eval_data(train_document, vocab, pretrain.get(), batch_size, false);
    DataLoader dev_data(dev_document, vocab, pretrain.get(), batch_size, false);

    ParameterCollection dynet_model;
    SetWeightDecay(dynet_model, vm["wdecay"].as<float>());
    Parser parser(dynet_model, config, vocab, pretrain.get());
    cerr << "Total parameters: " << dynet_model.parameter_count() << endl;

    if (init_checkpoint) {
      ParameterCollection init_model;
      Parser init_parser(init_model, init_checkpoint->config, init_checkpoint->vocab, pretrain.get());
      RestoreParameters(*init_checkpoint, init_model);
      parser.InitializeFrom(init_parser);
    }

    TrainingOptions options = CreateTrainingOptions(vm, config.num_layers);
    TrainerFactory trainer_factory = [&vm](ParameterCollection& model, float learning_rate) {
      return CreateTrainer(model, vm, learning_rate);
    };
    ParserLearner learner(parser, dynet_model, vocab, trainer_factory, options.learning_rate, vm["max_grad_norm"].as<float>(), (bool)init_checkpoint, model_file);

    ConllEvaluator train_evaluator(train_eval_data, train_document, vocab.deprel, output_file, train_file);
    ConllEvaluator dev_evaluator(dev_data, dev_document, vocab.deprel, output_file, gold_file);

    controller = new TrainingController(train_data, train_evaluator, dev_evaluator, learner, options);
    signal (SIGINT, [](int) { cerr << "ctrl-c pressed. Stopping..." << endl; controller->Stop(); } );
    controller->Train();
    delete controller;
    controller = nullptr;
  }
  catch (const po::error& e) {
    cerr << "Invalid arguments: " << e.what() << endl;
    cerr << desc;
    return 1;
  }
  catch (const exception& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }

  return 0;
}
