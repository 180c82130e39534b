#pragma once
#include <vector>
#include <string>
#include <iostream>

using namespace std;

enum ConllColumn {kId = 0, kForm = 1, kLemma = 2, kUpos = 3, kXpos = 4, kFeats = 5, kHead = 6, kDeprel = 7, kDeps = 8, kMisc = 9};
const unsigned kConllColumnCount = 10;

// One sentence of a CoNLL-U file. Every line is kept, so that comments,
// multiword token ranges and empty nodes survive a read/write round trip,
// but only the syntactic words are visible through Get() and Set().
class ConllSentence {
public:
  unsigned NumWords() const;
  const string& Get(unsigned word, ConllColumn column) const;
  void Set(unsigned word, ConllColumn column, const string& value);
  vector<string> Column(ConllColumn column) const;

  void AddComment(const string& line);
  void AddLine(const vector<string>& fields);
  void Write(ostream& out) const;

private:
  vector<string> comments;
  vector<vector<string>> lines;
  vector<unsigned> words; // indices into lines
};

class ConllDocument {
public:
  unsigned NumSentences() const;
  unsigned NumWords() const;
  ConllSentence& operator[](unsigned i);
  const ConllSentence& operator[](unsigned i) const;

  void Read(istream& in);
  void Write(ostream& out) const;

  static ConllDocument ReadFile(const string& filename);
  void WriteFile(const string& filename) const;

private:
  vector<ConllSentence> sentences;
};
