#pragma once
#include <iostream>
#include <string>
#include <vector>
#include <boost/serialization/access.hpp>
#include <boost/serialization/string.hpp>

using namespace std;

enum LstmType {kBiHighwayLstm = 0, kHighwayLstm = 1, kWeightDropLstm = 2};
istream& operator>>(istream& in, LstmType& lstm_type);
ostream& operator<<(ostream& out, const LstmType& lstm_type);

enum ScorerType {kBiaffineScorer = 0, kMlpScorer = 1};
istream& operator>>(istream& in, ScorerType& scorer_type);
ostream& operator<<(ostream& out, const ScorerType& scorer_type);

// Every setting needed to rebuild a parser. Saved with the checkpoint.
struct ParserConfig {
  ParserConfig();

  unsigned word_emb_dim;
  unsigned lemma_emb_dim;
  unsigned tag_emb_dim;
  unsigned char_emb_dim;
  unsigned char_hidden_dim;
  unsigned char_num_layers;
  unsigned transformed_dim;
  unsigned pretrain_dim; // 0 when no pretrained vectors are used
  unsigned hidden_dim;
  unsigned output_hidden_dim;
  unsigned deep_biaff_hidden_dim;
  unsigned num_layers;
  LstmType lstm_type;
  ScorerType scorer;
  bool use_char;
  bool use_linearization;
  bool use_distance;
  bool use_deprel_loss;
  float word_dropout;
  float dropout;
  float rec_dropout;
  string xpos_separator;
  unsigned vocab_cutoff;

  // Throws invalid_argument if the settings cannot build a parser
  void Validate() const;

private:
  friend class boost::serialization::access;
  template<class Archive>
  void serialize(Archive& ar, const unsigned int) {
    ar & word_emb_dim & lemma_emb_dim & tag_emb_dim;
    ar & char_emb_dim & char_hidden_dim & char_num_layers;
    ar & transformed_dim & pretrain_dim;
    ar & hidden_dim & output_hidden_dim & deep_biaff_hidden_dim & num_layers;
    ar & lstm_type & scorer;
    ar & use_char & use_linearization & use_distance & use_deprel_loss;
    ar & word_dropout & dropout & rec_dropout;
    ar & xpos_separator & vocab_cutoff;
  }
};
