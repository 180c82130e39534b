#include <iostream>
#include <algorithm>
#include <numeric>
#include <random>
#include "dynet/dynet.h"
#include "batch.h"
#include "conll.h"
#include "vocab.h"
#include "pretrain.h"

using namespace dynet;

unsigned EncodedSentence::size() const {
  return words.size();
}

int ParseHead(const string& field) {
  if (field.empty() || field.find_first_not_of("0123456789") != string::npos) {
    return kIgnoreHead;
  }
  return stoi(field);
}

EncodedSentence EncodeSentence(const ConllDocument& document, unsigned index, MultiVocab& vocab, Pretrain* pretrain) {
  const ConllSentence& sentence = document[index];
  EncodedSentence encoded;
  encoded.index = index;

  encoded.words.push_back(kRootId);
  encoded.lemmas.push_back(kRootId);
  encoded.upos.push_back(kRootId);
  encoded.xpos.push_back(vocab.xpos.Convert(kRoot));
  encoded.feats.push_back(vocab.feats.Convert(kRoot));
  encoded.pretrained.push_back(kRootId);
  encoded.chars.push_back({kRootId});
  encoded.heads.push_back(kIgnoreHead);
  encoded.deprels.push_back(kPadId);

  for (unsigned i = 0; i < sentence.NumWords(); ++i) {
    const string& form = sentence.Get(i, kForm);
    encoded.words.push_back(vocab.word.Convert(form));
    encoded.lemmas.push_back(vocab.lemma.Convert(sentence.Get(i, kLemma)));
    encoded.upos.push_back(vocab.upos.Convert(sentence.Get(i, kUpos)));
    encoded.xpos.push_back(vocab.xpos.Convert(sentence.Get(i, kXpos)));
    encoded.feats.push_back(vocab.feats.Convert(sentence.Get(i, kFeats)));
    encoded.pretrained.push_back(pretrain != nullptr ? pretrain->Convert(form) : kPadId);

    vector<WordId> chars;
    for (const string& c : UTF8Split(form)) {
      chars.push_back(vocab.chars.Convert(c));
    }
    if (chars.size() == 0) {
      chars.push_back(kUnkId);
    }
    encoded.chars.push_back(chars);

    encoded.heads.push_back(ParseHead(sentence.Get(i, kHead)));
    encoded.deprels.push_back(vocab.deprel.Convert(sentence.Get(i, kDeprel)));
  }
  return encoded;
}

template<class T>
void AppendPadded(vector<vector<T>>& field, const vector<T>& values, unsigned length, const T& padding) {
  vector<T> padded(values);
  padded.resize(length, padding);
  field.push_back(padded);
}

Batch::Batch() : length(0) {}

Batch::Batch(const vector<const EncodedSentence*>& sentences) : length(0) {
  for (const EncodedSentence* sentence : sentences) {
    length = max(length, sentence->size());
  }

  for (const EncodedSentence* sentence : sentences) {
    lengths.push_back(sentence->size());
    original_index.push_back(sentence->index);
    AppendPadded(words, sentence->words, length, kPadId);
    AppendPadded(lemmas, sentence->lemmas, length, kPadId);
    AppendPadded(upos, sentence->upos, length, kPadId);
    AppendPadded(xpos, sentence->xpos, length, vector<WordId>(sentence->xpos[0].size(), kPadId));
    AppendPadded(feats, sentence->feats, length, vector<WordId>(sentence->feats[0].size(), kPadId));
    AppendPadded(pretrained, sentence->pretrained, length, kPadId);
    AppendPadded(chars, sentence->chars, length, vector<WordId>());
    AppendPadded(heads, sentence->heads, length, kIgnoreHead);
    AppendPadded(deprels, sentence->deprels, length, kPadId);
  }
}

unsigned Batch::size() const {
  return lengths.size();
}

unsigned Batch::Length() const {
  return length;
}

unsigned Batch::NumWords() const {
  unsigned count = 0;
  for (unsigned len : lengths) {
    count += len - 1;
  }
  return count;
}

bool Batch::IsPadding(unsigned b, unsigned t) const {
  return t >= lengths[b];
}

vector<unsigned> Batch::AtStep(const vector<vector<WordId>>& ids, unsigned t) const {
  vector<unsigned> step(ids.size());
  for (unsigned b = 0; b < ids.size(); ++b) {
    step[b] = ids[b][t];
  }
  return step;
}

vector<unsigned> Batch::AtStep(const vector<vector<vector<WordId>>>& ids, unsigned t, unsigned slot) const {
  vector<unsigned> step(ids.size());
  for (unsigned b = 0; b < ids.size(); ++b) {
    step[b] = ids[b][t][slot];
  }
  return step;
}

DataLoader::DataLoader(const ConllDocument& document, MultiVocab& vocab, Pretrain* pretrain, unsigned batch_size, bool training, float sample_fraction) :
    batch_size(batch_size), training(training) {
  vector<unsigned> indices(document.NumSentences());
  iota(indices.begin(), indices.end(), 0);
  if (training && sample_fraction < 1.0f) {
    shuffle(indices.begin(), indices.end(), *rndeng);
    unsigned keep = (unsigned)(sample_fraction * indices.size() + 0.5f);
    indices.resize(min((unsigned)indices.size(), max(1u, keep)));
    sort(indices.begin(), indices.end());
    cerr << "Subsampled " << indices.size() << " of " << document.NumSentences() << " training sentences" << endl;
  }

  for (unsigned index : indices) {
    sentences.push_back(EncodeSentence(document, index, vocab, pretrain));
  }

  vector<unsigned> order(sentences.size());
  iota(order.begin(), order.end(), 0);
  if (training) {
    Reshuffle();
  }
  else {
    stable_sort(order.begin(), order.end(), [&](unsigned a, unsigned b) {
      return sentences[a].size() < sentences[b].size();
    });
    MakeBatches(order);
  }
}

unsigned DataLoader::size() const {
  return batches.size();
}

const Batch& DataLoader::operator[](unsigned i) const {
  return batches[i];
}

void DataLoader::Reshuffle() {
  if (!training) {
    return;
  }

  uniform_real_distribution<float> jitter(0.0f, 5.0f);
  vector<pair<float, unsigned>> keys;
  for (unsigned i = 0; i < sentences.size(); ++i) {
    keys.push_back(make_pair(sentences[i].size() + jitter(*rndeng), i));
  }
  sort(keys.begin(), keys.end());

  vector<unsigned> order;
  for (const auto& key : keys) {
    order.push_back(key.second);
  }
  MakeBatches(order);
  shuffle(batches.begin(), batches.end(), *rndeng);
}

unsigned DataLoader::NumSentences() const {
  return sentences.size();
}

void DataLoader::MakeBatches(const vector<unsigned>& order) {
  batches.clear();
  vector<const EncodedSentence*> current;
  unsigned current_words = 0;
  for (unsigned i : order) {
    unsigned words = sentences[i].size() - 1;
    if (current.size() > 0 && current_words + words > batch_size) {
      batches.push_back(Batch(current));
      current.clear();
      current_words = 0;
    }
    current.push_back(&sentences[i]);
    current_words += words;
  }

  if (current.size() > 0) {
    batches.push_back(Batch(current));
  }
}
