#pragma once
#include <string>

using namespace std;

struct AttachmentScores {
  unsigned total;
  unsigned correct_heads;
  unsigned correct_labeled;

  AttachmentScores();
  float UAS() const;
  float LAS() const;
};

// Compares the heads and relations of a system CoNLL-U file against a gold
// file with the same tokenization. Relation subtypes (after ':') are ignored.
AttachmentScores ScoreAttachments(const string& system_file, const string& gold_file);

class ConllDocument;
AttachmentScores ScoreAttachments(const ConllDocument& system, const ConllDocument& gold);
