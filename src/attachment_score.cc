#include <stdexcept>
#include "attachment_score.h"
#include "conll.h"

AttachmentScores::AttachmentScores() : total(0), correct_heads(0), correct_labeled(0) {}

float AttachmentScores::UAS() const {
  return (total > 0) ? (float)correct_heads / total : 0.0f;
}

float AttachmentScores::LAS() const {
  return (total > 0) ? (float)correct_labeled / total : 0.0f;
}

string UniversalRelation(const string& relation) {
  return relation.substr(0, relation.find(':'));
}

AttachmentScores ScoreAttachments(const ConllDocument& system, const ConllDocument& gold) {
  if (system.NumSentences() != gold.NumSentences()) {
    throw runtime_error("System output has " + to_string(system.NumSentences()) + " sentences but the gold file has " + to_string(gold.NumSentences()));
  }

  AttachmentScores scores;
  for (unsigned i = 0; i < gold.NumSentences(); ++i) {
    const ConllSentence& system_sentence = system[i];
    const ConllSentence& gold_sentence = gold[i];
    if (system_sentence.NumWords() != gold_sentence.NumWords()) {
      throw runtime_error("Sentence " + to_string(i + 1) + " has a different number of words in the system output and the gold file");
    }

    for (unsigned j = 0; j < gold_sentence.NumWords(); ++j) {
      scores.total++;
      if (system_sentence.Get(j, kHead) != gold_sentence.Get(j, kHead)) {
        continue;
      }
      scores.correct_heads++;
      if (UniversalRelation(system_sentence.Get(j, kDeprel)) == UniversalRelation(gold_sentence.Get(j, kDeprel))) {
        scores.correct_labeled++;
      }
    }
  }
  return scores;
}

AttachmentScores ScoreAttachments(const string& system_file, const string& gold_file) {
  return ScoreAttachments(ConllDocument::ReadFile(system_file), ConllDocument::ReadFile(gold_file));
}
