#include <iostream>
#include <memory>
#include <stdexcept>
#include <boost/program_options.hpp>
#include "dynet/dynet.h"
#include "dynet/init.h"
#include "conll.h"
#include "vocab.h"
#include "pretrain.h"
#include "batch.h"
#include "parser.h"
#include "evaluator.h"
#include "attachment_score.h"
#include "io.h"

using namespace dynet;
using namespace std;
namespace po = boost::program_options;

int main(int argc, char** argv) {
  dynet::initialize(argc, argv);

  po::options_description desc("description");
  desc.add_options()
  ("model", po::value<string>()->required(), "Model file, as output by train_parser")
  ("input_file", po::value<string>()->required(), "Sentences to parse in CoNLL-U format")
  ("output_file", po::value<string>()->required(), "Where the parsed sentences are written")
  ("gold_file", po::value<string>(), "If given, score the output against this file")
  ("pretrained", po::value<string>(), "Pretrained word vectors, required if the model was trained with them")
  ("pretrain_max_vocab", po::value<unsigned>()->default_value(0), "Read at most this many pretrained vectors. 0 reads all")
  ("batch_size", po::value<unsigned>()->default_value(5000), "Maximum number of words per batch")
  ("help", "Display this help message");

  po::positional_options_description positional_options;
  positional_options.add("model", 1);
  positional_options.add("input_file", 1);
  positional_options.add("output_file", 1);

  try {
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional_options).run(), vm);

    if (vm.count("help")) {
      cerr << desc;
      return 1;
    }

    po::notify(vm);

    Checkpoint checkpoint = Deserialize(vm["model"].as<string>());

    unique_ptr<Pretrain> pretrain;
    if (checkpoint.config.pretrain_dim > 0) {
      if (!vm.count("pretrained")) {
        throw invalid_argument("This model was trained with pretrained vectors; please pass them with --pretrained");
      }
      pretrain.reset(new Pretrain(vm["pretrained"].as<string>(), vm["pretrain_max_vocab"].as<unsigned>()));
    }

    ParameterCollection dynet_model;
    Parser parser(dynet_model, checkpoint.config, checkpoint.vocab, pretrain.get());
    RestoreParameters(checkpoint, dynet_model);

    ConllDocument document = ConllDocument::ReadFile(vm["input_file"].as<string>());
    DataLoader data(document, checkpoint.vocab, pretrain.get(), vm["batch_size"].as<unsigned>(), false);

    vector<SentencePrediction> predictions;
    for (unsigned i = 0; i < data.size(); ++i) {
      ComputationGraph cg;
      ForwardResult result = parser.Forward(data[i], cg, false);
      predictions.insert(predictions.end(), result.predictions.begin(), result.predictions.end());
    }

    WritePredictions(predictions, checkpoint.vocab.deprel, document);
    document.WriteFile(vm["output_file"].as<string>());
    cerr << "Parsed " << document.NumSentences() << " sentences" << endl;

    if (vm.count("gold_file")) {
      AttachmentScores scores = ScoreAttachments(vm["output_file"].as<string>(), vm["gold_file"].as<string>());
      cerr << "Parser score:" << endl;
      cout << "UAS " << scores.UAS() * 100.0f << endl;
      cout << "LAS " << scores.LAS() * 100.0f << endl;
    }
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
