#include <stdexcept>
#include "embedder.h"
#include "vocab.h"
#include "pretrain.h"

FeatureEmbedder::FeatureEmbedder(ParameterCollection& model, const ParserConfig& config, const MultiVocab& vocab, Pretrain* pretrain) :
    input_dim(0), word_emb_dim(config.word_emb_dim), lemma_emb_dim(config.lemma_emb_dim), tag_emb_dim(config.tag_emb_dim), word_dropout_rate(0.0f), dropout_rate(0.0f), rng((*rndeng)()), pretrain(pretrain), pcg(nullptr) {
  if (config.pretrain_dim > 0) {
    if (pretrain == nullptr || pretrain->Dim() != config.pretrain_dim) {
      throw invalid_argument("Pretrained vectors of dimension " + to_string(config.pretrain_dim) + " are required by this configuration");
    }
    p_trans_pretrained = model.add_parameters({config.transformed_dim, config.pretrain_dim});
    input_dim += config.transformed_dim;
  }
  else {
    this->pretrain = nullptr;
  }

  if (config.word_emb_dim > 0) {
    word_embeddings = model.add_lookup_parameters(vocab.word.size(), {config.word_emb_dim});
    input_dim += config.word_emb_dim;
  }

  if (config.lemma_emb_dim > 0) {
    lemma_embeddings = model.add_lookup_parameters(vocab.lemma.size(), {config.lemma_emb_dim});
    input_dim += config.lemma_emb_dim;
  }

  if (config.tag_emb_dim > 0) {
    upos_embeddings = model.add_lookup_parameters(vocab.upos.size(), {config.tag_emb_dim});
    for (unsigned size : vocab.xpos.SlotSizes()) {
      xpos_embeddings.push_back(model.add_lookup_parameters(size, {config.tag_emb_dim}));
    }
    for (unsigned size : vocab.feats.SlotSizes()) {
      feats_embeddings.push_back(model.add_lookup_parameters(size, {config.tag_emb_dim}));
    }
    input_dim += 2 * config.tag_emb_dim;
  }

  if (config.use_char && config.char_emb_dim > 0) {
    char_model.reset(new CharacterModel(model, vocab.chars.size(), config.char_emb_dim, config.char_hidden_dim, config.char_num_layers));
    p_trans_char = model.add_parameters({config.transformed_dim, config.char_hidden_dim});
    input_dim += config.transformed_dim;
  }

  if (input_dim == 0) {
    throw invalid_argument("No input features enabled");
  }

  p_drop_replacement = model.add_parameters({input_dim}, ParameterInitNormal(0.0f, 1.0f / input_dim));
}

void FeatureEmbedder::NewGraph(ComputationGraph& cg) {
  pcg = &cg;
  if (pretrain != nullptr) {
    trans_pretrained = parameter(cg, p_trans_pretrained);
  }
  if (char_model) {
    char_model->NewGraph(cg);
    trans_char = parameter(cg, p_trans_char);
  }
  drop_replacement = parameter(cg, p_drop_replacement);
}

void FeatureEmbedder::SetDropout(float word_dropout, float dropout) {
  word_dropout_rate = word_dropout;
  dropout_rate = dropout;
  if (char_model) {
    char_model->SetDropout(dropout);
  }
}

void FeatureEmbedder::Reseed(unsigned seed) {
  rng.seed(seed);
}

unsigned FeatureEmbedder::Dim() const {
  return input_dim;
}

vector<Expression> FeatureEmbedder::Embed(const Batch& batch) {
  vector<Expression> char_reps;
  if (char_model) {
    char_reps = char_model->Embed(batch);
  }

  vector<Expression> embeddings(batch.Length());
  for (unsigned t = 0; t < batch.Length(); ++t) {
    Expression x = EmbedStep(batch, t, char_reps);
    if (word_dropout_rate > 0.0f) {
      x = WordDropout(x, batch.size());
    }
    if (dropout_rate > 0.0f) {
      x = dropout(x, dropout_rate);
    }
    embeddings[t] = x;
  }
  return embeddings;
}

Expression FeatureEmbedder::EmbedStep(const Batch& batch, unsigned t, const vector<Expression>& char_reps) {
  vector<Expression> pieces;
  if (pretrain != nullptr) {
    Expression pretrained_emb = const_lookup(*pcg, pretrain->Embeddings(), batch.AtStep(batch.pretrained, t));
    pieces.push_back(trans_pretrained * pretrained_emb);
  }

  if (word_emb_dim > 0) {
    pieces.push_back(lookup(*pcg, word_embeddings, batch.AtStep(batch.words, t)));
  }

  if (lemma_emb_dim > 0) {
    pieces.push_back(lookup(*pcg, lemma_embeddings, batch.AtStep(batch.lemmas, t)));
  }

  if (tag_emb_dim > 0) {
    vector<Expression> pos_pieces;
    pos_pieces.push_back(lookup(*pcg, upos_embeddings, batch.AtStep(batch.upos, t)));
    for (unsigned slot = 0; slot < xpos_embeddings.size(); ++slot) {
      pos_pieces.push_back(lookup(*pcg, xpos_embeddings[slot], batch.AtStep(batch.xpos, t, slot)));
    }
    pieces.push_back(sum(pos_pieces));

    vector<Expression> feats_pieces;
    for (unsigned slot = 0; slot < feats_embeddings.size(); ++slot) {
      feats_pieces.push_back(lookup(*pcg, feats_embeddings[slot], batch.AtStep(batch.feats, t, slot)));
    }
    pieces.push_back(sum(feats_pieces));
  }

  if (char_model) {
    Expression char_rep = char_reps[t];
    if (dropout_rate > 0.0f) {
      char_rep = dropout(char_rep, dropout_rate);
    }
    pieces.push_back(trans_char * char_rep);
  }

  return concatenate(pieces);
}

// Replaces whole token vectors by the shared replacement vector
Expression FeatureEmbedder::WordDropout(Expression x, unsigned batch_size) {
  bernoulli_distribution drop(word_dropout_rate);
  vector<float> keep_mask(batch_size);
  vector<float> drop_mask(batch_size);
  for (unsigned b = 0; b < batch_size; ++b) {
    bool dropped = drop(rng);
    keep_mask[b] = dropped ? 0.0f : 1.0f;
    drop_mask[b] = dropped ? 1.0f : 0.0f;
  }

  Expression keep = input(*pcg, Dim({1}, batch_size), keep_mask);
  Expression replace = input(*pcg, Dim({1}, batch_size), drop_mask);
  return x * keep + drop_replacement * replace;
}
