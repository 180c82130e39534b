#include <algorithm>
#include <stdexcept>
#include <boost/program_options.hpp>
#include "config.h"

istream& operator>>(istream& in, LstmType& lstm_type) {
  string token;
  in >> token;
  transform(token.begin(), token.end(), token.begin(), ::tolower);

  if (token == "bihlstm") {
    lstm_type = kBiHighwayLstm;
  }
  else if (token == "hlstm") {
    lstm_type = kHighwayLstm;
  }
  else if (token == "wdlstm") {
    lstm_type = kWeightDropLstm;
  }
  else {
    throw boost::program_options::validation_error(boost::program_options::validation_error::invalid_option_value, "lstm_type", token);
  }
  return in;
}

ostream& operator<<(ostream& out, const LstmType& lstm_type) {
  switch (lstm_type) {
    case kBiHighwayLstm:
      return out << "bihlstm";
    case kHighwayLstm:
      return out << "hlstm";
    case kWeightDropLstm:
      return out << "wdlstm";
  }
  return out << "unknown";
}

istream& operator>>(istream& in, ScorerType& scorer_type) {
  string token;
  in >> token;
  transform(token.begin(), token.end(), token.begin(), ::tolower);

  if (token == "biaffine") {
    scorer_type = kBiaffineScorer;
  }
  else if (token == "mlp") {
    scorer_type = kMlpScorer;
  }
  else {
    throw boost::program_options::validation_error(boost::program_options::validation_error::invalid_option_value, "scorer", token);
  }
  return in;
}

ostream& operator<<(ostream& out, const ScorerType& scorer_type) {
  switch (scorer_type) {
    case kBiaffineScorer:
      return out << "biaffine";
    case kMlpScorer:
      return out << "mlp";
  }
  return out << "unknown";
}

ParserConfig::ParserConfig() :
  word_emb_dim(75), lemma_emb_dim(75), tag_emb_dim(50),
  char_emb_dim(100), char_hidden_dim(400), char_num_layers(1),
  transformed_dim(125), pretrain_dim(0),
  hidden_dim(400), output_hidden_dim(400), deep_biaff_hidden_dim(400), num_layers(3),
  lstm_type(kBiHighwayLstm), scorer(kBiaffineScorer),
  use_char(true), use_linearization(true), use_distance(true), use_deprel_loss(true),
  word_dropout(0.33f), dropout(0.5f), rec_dropout(0.0f),
  xpos_separator(""), vocab_cutoff(7) {}

void ParserConfig::Validate() const {
  bool any_source = word_emb_dim > 0 || lemma_emb_dim > 0 || tag_emb_dim > 0 || (use_char && char_emb_dim > 0) || pretrain_dim > 0;
  if (!any_source) {
    throw invalid_argument("No input features enabled: at least one of the word, lemma, tag, character or pretrained embeddings must have a positive width");
  }
  if (((use_char && char_emb_dim > 0) || pretrain_dim > 0) && transformed_dim == 0) {
    throw invalid_argument("transformed_dim must be positive when character or pretrained embeddings are used");
  }
  if (use_char && char_emb_dim > 0 && (char_hidden_dim == 0 || char_num_layers == 0)) {
    throw invalid_argument("char_hidden_dim and char_num_layers must be positive when character embeddings are used");
  }
  if (hidden_dim == 0 || num_layers == 0) {
    throw invalid_argument("hidden_dim and num_layers must be positive");
  }
  if (lstm_type == kWeightDropLstm && output_hidden_dim == 0) {
    throw invalid_argument("output_hidden_dim must be positive for wdlstm");
  }
  if (deep_biaff_hidden_dim == 0) {
    throw invalid_argument("deep_biaff_hidden_dim must be positive");
  }
  if (word_dropout < 0.0f || word_dropout >= 1.0f || dropout < 0.0f || dropout >= 1.0f || rec_dropout < 0.0f || rec_dropout >= 1.0f) {
    throw invalid_argument("Dropout rates must lie in [0, 1)");
  }
}
