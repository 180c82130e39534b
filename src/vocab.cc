#include <map>
#include <set>
#include <algorithm>
#include "vocab.h"
#include "conll.h"

const string kPad = "<PAD>";
const string kUnk = "<UNK>";
const string kRoot = "<ROOT>";
const string kEmptySlot = "_";

Vocab::Vocab() : lowercase_input(false), reserve_empty_slot(false) {
  Reset({});
}

Vocab::Vocab(bool lower, bool reserve_empty_slot) : lowercase_input(lower), reserve_empty_slot(reserve_empty_slot) {
  Reset({});
}

void Vocab::Build(const vector<string>& tokens, unsigned cutoff) {
  map<string, unsigned> counts;
  for (const string& token : tokens) {
    counts[Normalize(token)]++;
  }

  vector<pair<unsigned, string>> entries;
  for (const auto& kv : counts) {
    if (kv.second >= cutoff) {
      entries.push_back(make_pair(kv.second, kv.first));
    }
  }
  sort(entries.begin(), entries.end(), [](const pair<unsigned, string>& a, const pair<unsigned, string>& b) {
    return (a.first != b.first) ? a.first > b.first : a.second < b.second;
  });

  vector<string> words;
  for (const auto& entry : entries) {
    words.push_back(entry.second);
  }
  Reset(words);
}

string Vocab::Normalize(const string& word) const {
  if (!lowercase_input || word == kPad || word == kUnk || word == kRoot) {
    return word;
  }
  return lowercase(word);
}

// Rebuilds the dictionary as the reserved entries followed by words.
// Reserved strings appearing in words keep their reserved ids.
void Vocab::Reset(const vector<string>& words) {
  dict = Dict();
  dict.convert(kPad);
  dict.convert(kUnk);
  dict.convert(kRoot);
  if (reserve_empty_slot) {
    dict.convert(kEmptySlot);
  }
  for (const string& word : words) {
    dict.convert(word);
  }
  dict.freeze();
  dict.set_unk(kUnk);
}

WordId Vocab::Convert(const string& word) {
  return dict.convert(Normalize(word));
}

const string& Vocab::Convert(WordId id) const {
  return dict.convert(id);
}

bool Vocab::Contains(const string& word) const {
  return dict.contains(Normalize(word));
}

unsigned Vocab::size() const {
  return dict.size();
}

CompositeVocab::CompositeVocab() : keyed(false) {}

CompositeVocab::CompositeVocab(bool keyed, const string& separator) : keyed(keyed), separator(separator) {}

vector<string> CompositeVocab::Split(const string& tag) const {
  if (tag == kEmptySlot) {
    return {};
  }
  if (separator.empty()) {
    return {tag};
  }
  return tokenize(tag, separator);
}

void CompositeVocab::Build(const vector<string>& tags) {
  keys.clear();
  vocabs.clear();

  if (keyed) {
    map<string, vector<string>> values;
    for (const string& tag : tags) {
      for (const string& part : Split(tag)) {
        vector<string> kv = tokenize(part, "=", 1);
        values[kv[0]].push_back(kv.size() > 1 ? kv[1] : kEmptySlot);
      }
    }

    // std::map iterates in key order, so slots are sorted by feature name
    for (const auto& kv : values) {
      keys.push_back(kv.first);
      vocabs.push_back(Vocab(false, true));
      vocabs.back().Build(kv.second, 1);
    }
  }
  else {
    vector<vector<string>> values;
    for (const string& tag : tags) {
      vector<string> parts = Split(tag);
      if (parts.size() > values.size()) {
        values.resize(parts.size());
      }
      for (unsigned i = 0; i < parts.size(); ++i) {
        values[i].push_back(parts[i]);
      }
    }

    for (unsigned i = 0; i < values.size(); ++i) {
      keys.push_back(to_string(i));
      vocabs.push_back(Vocab(false, true));
      vocabs.back().Build(values[i], 1);
    }
  }

  // Every composite vocabulary has at least one slot, even with no data
  if (vocabs.size() == 0) {
    keys.push_back(kEmptySlot);
    vocabs.push_back(Vocab(false, true));
  }
}

vector<WordId> CompositeVocab::Convert(const string& tag) {
  if (tag == kPad || tag == kRoot) {
    return vector<WordId>(vocabs.size(), tag == kPad ? kPadId : kRootId);
  }

  vector<WordId> ids(vocabs.size(), kEmptySlotId);
  vector<string> parts = Split(tag);
  if (keyed) {
    for (const string& part : parts) {
      vector<string> kv = tokenize(part, "=", 1);
      auto it = find(keys.begin(), keys.end(), kv[0]);
      if (it == keys.end()) {
        continue;
      }
      unsigned slot = it - keys.begin();
      ids[slot] = vocabs[slot].Convert(kv.size() > 1 ? kv[1] : kEmptySlot);
    }
  }
  else {
    for (unsigned i = 0; i < parts.size() && i < vocabs.size(); ++i) {
      ids[i] = vocabs[i].Convert(parts[i]);
    }
  }
  return ids;
}

unsigned CompositeVocab::NumSlots() const {
  return vocabs.size();
}

vector<unsigned> CompositeVocab::SlotSizes() const {
  vector<unsigned> sizes;
  for (const Vocab& vocab : vocabs) {
    sizes.push_back(vocab.size());
  }
  return sizes;
}

MultiVocab::MultiVocab() {}

MultiVocab::MultiVocab(const ConllDocument& train, unsigned cutoff, const string& xpos_separator) :
    word(true), lemma(true), upos(false), xpos(false, xpos_separator), feats(true, "|"), deprel(false), chars(false) {
  vector<string> forms, lemmas, upos_tags, xpos_tags, feat_bundles, relations, characters;
  for (unsigned i = 0; i < train.NumSentences(); ++i) {
    const ConllSentence& sentence = train[i];
    for (unsigned j = 0; j < sentence.NumWords(); ++j) {
      forms.push_back(sentence.Get(j, kForm));
      lemmas.push_back(sentence.Get(j, kLemma));
      upos_tags.push_back(sentence.Get(j, kUpos));
      xpos_tags.push_back(sentence.Get(j, kXpos));
      feat_bundles.push_back(sentence.Get(j, kFeats));
      relations.push_back(sentence.Get(j, kDeprel));
      for (const string& c : UTF8Split(sentence.Get(j, kForm))) {
        characters.push_back(c);
      }
    }
  }

  word.Build(forms, cutoff);
  lemma.Build(lemmas, cutoff);
  upos.Build(upos_tags, 1);
  xpos.Build(xpos_tags);
  feats.Build(feat_bundles);
  deprel.Build(relations, 1);
  chars.Build(characters, 1);
}
