#include <stdexcept>
#include "train.h"
#include "utils.h"

void AddTrainerOptions(po::options_description& desc) {
  desc.add_options()
  ("sgd", "Use SGD for optimization")
  ("momentum", "Use SGD with momentum")
  ("adagrad", "Use Adagrad for optimization")
  ("adadelta", "Use Adadelta for optimization")
  ("rmsprop", "Use RMSProp for optimization")
  ("adam", "Use Adam for optimization (default)")
  ("amsgrad", "Use AMSGrad for optimization")
  ("learning_rate", po::value<float>()->default_value(3e-3f), "Learning rate for the optimizer (ignored by Adadelta)")
  ("gamma", po::value<float>()->default_value(0.9f), "Momentum strength (Momentum only)")
  ("beta1", po::value<float>()->default_value(0.9f), "Beta1 (Adam and AMSGrad only)")
  ("beta2", po::value<float>()->default_value(0.999f), "Beta2 (Adam and AMSGrad, and AMSGrad after a patience switch)")
  ("rho", po::value<float>(), "Moving average decay parameter (RMSProp and Adadelta only)")
  ("epsilon", po::value<float>(), "Epsilon value for optimizer (Adagrad, Adadelta, RMSProp, Adam and AMSGrad only)")
  ("max_grad_norm", po::value<float>()->default_value(1.0f), "Clip the joint norm of all gradients to this value. 0 disables clipping.")
  ("wdecay", po::value<float>()->default_value(1e-6f), "L2 weight decay");
}

void AddParserOptions(po::options_description& desc) {
  desc.add_options()
  ("vocab_cutoff", po::value<unsigned>()->default_value(7), "Minimum training count of words and lemmas kept in the vocabulary")
  ("xpos_separator", po::value<string>()->default_value(""), "Split fine-grained tags on this string into independently embedded parts")
  ("word_emb_dim", po::value<unsigned>()->default_value(75), "Word embedding size. 0 disables word embeddings")
  ("lemma_emb_dim", po::value<unsigned>()->default_value(75), "Lemma embedding size. 0 disables lemma embeddings")
  ("tag_emb_dim", po::value<unsigned>()->default_value(50), "Tag and feature embedding size. 0 disables both")
  ("char_emb_dim", po::value<unsigned>()->default_value(100), "Character embedding size")
  ("char_hidden_dim", po::value<unsigned>()->default_value(400), "Hidden size of the character LSTM")
  ("char_num_layers", po::value<unsigned>()->default_value(1), "Layers of the character LSTM")
  ("transformed_dim", po::value<unsigned>()->default_value(125), "Size the character and pretrained vectors are projected to")
  ("hidden_dim", po::value<unsigned>()->default_value(400), "Hidden size of the recurrent layers")
  ("output_hidden_dim", po::value<unsigned>()->default_value(400), "Hidden size of the top recurrent layer (wdlstm only)")
  ("deep_biaff_hidden_dim", po::value<unsigned>()->default_value(400), "Hidden size of the pairwise scorers")
  ("num_layers", po::value<unsigned>()->default_value(3), "Number of recurrent layers")
  ("lstm_type", po::value<LstmType>()->default_value(kBiHighwayLstm), "Recurrent encoder. One of \"bihlstm\", \"hlstm\" or \"wdlstm\"")
  ("scorer", po::value<ScorerType>()->default_value(kBiaffineScorer), "Pairwise scorer. One of \"biaffine\" or \"mlp\"")
  ("no_char", "Turn off the character model")
  ("no_pretrain", "Turn off pretrained embeddings")
  ("no_linearization", "Turn off the linearization term")
  ("no_distance", "Turn off the distance term")
  ("no_deprel_loss", "Do not predict relation labels")
  ("word_dropout", po::value<float>()->default_value(0.33f), "Probability of replacing a whole token vector")
  ("dropout", po::value<float>()->default_value(0.5f), "Dropout rate")
  ("rec_dropout", po::value<float>()->default_value(0.0f), "Recurrent dropout rate");
}

void AddTrainingOptions(po::options_description& desc) {
  desc.add_options()
  ("max_steps", po::value<unsigned>()->default_value(50000), "Stop after this many updates")
  ("eval_interval", po::value<unsigned>()->default_value(100), "Evaluate every this many updates")
  ("max_steps_before_stop", po::value<unsigned>()->default_value(6000), "Updates without dev improvement before switching to AMSGrad, and then before stopping")
  ("batch_size", po::value<unsigned>()->default_value(5000), "Maximum number of words per batch")
  ("log_step", po::value<unsigned>()->default_value(20), "Print the loss every this many updates")
  ("unfreeze_points", po::value<vector<unsigned>>()->multitoken(), "Steps at which frozen recurrent layers are thawed, top layer first. Only layers restored with --init_model start frozen")
  ("lr_shrink", po::value<float>()->default_value(1.0f / 2.6f), "Learning rate factor applied per thawed layer")
  ("sample_train", po::value<float>()->default_value(1.0f), "Fraction of the training data to use")
  ("seed", po::value<unsigned>()->default_value(1234), "Random seed");
}

Trainer* CreateTrainer(ParameterCollection& model, const po::variables_map& vm, float learning_rate) {
  unsigned learner_count = vm.count("sgd") + vm.count("momentum") + vm.count("adagrad") + vm.count("adadelta") + vm.count("rmsprop") + vm.count("adam") + vm.count("amsgrad");
  if (learner_count > 1) {
    throw invalid_argument("Please specify only one learner type");
  }

  const float beta1 = vm["beta1"].as<float>();
  const float beta2 = vm["beta2"].as<float>();
  Trainer* trainer = nullptr;
  if (vm.count("sgd")) {
    trainer = new SimpleSGDTrainer(model, learning_rate);
  }
  else if (vm.count("momentum")) {
    trainer = new MomentumSGDTrainer(model, learning_rate, vm["gamma"].as<float>());
  }
  else if (vm.count("adagrad")) {
    float eps = (vm.count("epsilon")) ? vm["epsilon"].as<float>() : 1e-20f;
    trainer = new AdagradTrainer(model, learning_rate, eps);
  }
  else if (vm.count("adadelta")) {
    float eps = (vm.count("epsilon")) ? vm["epsilon"].as<float>() : 1e-6f;
    float rho = (vm.count("rho")) ? vm["rho"].as<float>() : 0.95f;
    trainer = new AdadeltaTrainer(model, eps, rho);
  }
  else if (vm.count("rmsprop")) {
    float eps = (vm.count("epsilon")) ? vm["epsilon"].as<float>() : 1e-20f;
    float rho = (vm.count("rho")) ? vm["rho"].as<float>() : 0.95f;
    trainer = new RMSPropTrainer(model, learning_rate, eps, rho);
  }
  else if (vm.count("amsgrad")) {
    float eps = (vm.count("epsilon")) ? vm["epsilon"].as<float>() : 1e-8f;
    trainer = new AmsgradTrainer(model, learning_rate, beta1, beta2, eps);
  }
  else { /* adam */
    float eps = (vm.count("epsilon")) ? vm["epsilon"].as<float>() : 1e-8f;
    trainer = new AdamTrainer(model, learning_rate, beta1, beta2, eps);
  }
  return trainer;
}

void SetWeightDecay(ParameterCollection& model, float lambda) {
  if (lambda < 0.0f) {
    throw invalid_argument("Weight decay must not be negative");
  }
  model.set_weight_decay_lambda(lambda);
}

ParserConfig CreateParserConfig(const po::variables_map& vm) {
  ParserConfig config;
  config.vocab_cutoff = vm["vocab_cutoff"].as<unsigned>();
  config.xpos_separator = vm["xpos_separator"].as<string>();
  config.word_emb_dim = vm["word_emb_dim"].as<unsigned>();
  config.lemma_emb_dim = vm["lemma_emb_dim"].as<unsigned>();
  config.tag_emb_dim = vm["tag_emb_dim"].as<unsigned>();
  config.char_emb_dim = vm["char_emb_dim"].as<unsigned>();
  config.char_hidden_dim = vm["char_hidden_dim"].as<unsigned>();
  config.char_num_layers = vm["char_num_layers"].as<unsigned>();
  config.transformed_dim = vm["transformed_dim"].as<unsigned>();
  config.hidden_dim = vm["hidden_dim"].as<unsigned>();
  config.output_hidden_dim = vm["output_hidden_dim"].as<unsigned>();
  config.deep_biaff_hidden_dim = vm["deep_biaff_hidden_dim"].as<unsigned>();
  config.num_layers = vm["num_layers"].as<unsigned>();
  config.lstm_type = vm["lstm_type"].as<LstmType>();
  config.scorer = vm["scorer"].as<ScorerType>();
  config.use_char = (vm.count("no_char") == 0);
  config.use_linearization = (vm.count("no_linearization") == 0);
  config.use_distance = (vm.count("no_distance") == 0);
  config.use_deprel_loss = (vm.count("no_deprel_loss") == 0);
  config.word_dropout = vm["word_dropout"].as<float>();
  config.dropout = vm["dropout"].as<float>();
  config.rec_dropout = vm["rec_dropout"].as<float>();
  // pretrain_dim is filled in once the vectors are read
  config.pretrain_dim = 0;
  return config;
}

TrainingOptions CreateTrainingOptions(const po::variables_map& vm, unsigned num_layers) {
  TrainingOptions options;
  options.max_steps = vm["max_steps"].as<unsigned>();
  options.eval_interval = vm["eval_interval"].as<unsigned>();
  options.max_steps_before_stop = vm["max_steps_before_stop"].as<unsigned>();
  options.log_step = vm["log_step"].as<unsigned>();
  options.num_layers = num_layers;
  if (vm.count("unfreeze_points")) {
    options.unfreeze_points = vm["unfreeze_points"].as<vector<unsigned>>();
  }
  options.learning_rate = vm["learning_rate"].as<float>();
  options.lr_shrink = vm["lr_shrink"].as<float>();
  options.beta2 = vm["beta2"].as<float>();
  return options;
}
