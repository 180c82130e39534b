#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/algorithm/string/join.hpp>
#include "conll.h"
#include "utils.h"

unsigned ConllSentence::NumWords() const {
  return words.size();
}

const string& ConllSentence::Get(unsigned word, ConllColumn column) const {
  return lines.at(words.at(word))[column];
}

void ConllSentence::Set(unsigned word, ConllColumn column, const string& value) {
  lines.at(words.at(word))[column] = value;
}

vector<string> ConllSentence::Column(ConllColumn column) const {
  vector<string> values(words.size());
  for (unsigned i = 0; i < words.size(); ++i) {
    values[i] = lines[words[i]][column];
  }
  return values;
}

void ConllSentence::AddComment(const string& line) {
  comments.push_back(line);
}

void ConllSentence::AddLine(const vector<string>& fields) {
  if (fields.size() != kConllColumnCount) {
    ostringstream message;
    message << "Expected " << kConllColumnCount << " tab-separated columns but found " << fields.size() << ": \"" << boost::algorithm::join(fields, "\t") << "\"";
    throw runtime_error(message.str());
  }

  // Multiword token ranges ("3-4") and empty nodes ("5.1") are not syntactic words
  const string& id = fields[kId];
  bool is_word = id.find('-') == string::npos && id.find('.') == string::npos;
  if (is_word) {
    words.push_back(lines.size());
  }
  lines.push_back(fields);
}

void ConllSentence::Write(ostream& out) const {
  for (const string& comment : comments) {
    out << comment << "\n";
  }
  for (const vector<string>& fields : lines) {
    out << boost::algorithm::join(fields, "\t") << "\n";
  }
  out << "\n";
}

unsigned ConllDocument::NumSentences() const {
  return sentences.size();
}

unsigned ConllDocument::NumWords() const {
  unsigned count = 0;
  for (const ConllSentence& sentence : sentences) {
    count += sentence.NumWords();
  }
  return count;
}

ConllSentence& ConllDocument::operator[](unsigned i) {
  return sentences[i];
}

const ConllSentence& ConllDocument::operator[](unsigned i) const {
  return sentences[i];
}

void ConllDocument::Read(istream& in) {
  ConllSentence current;
  bool empty = true;
  for (string line; getline(in, line);) {
    if (line.length() > 0 && line[line.length() - 1] == '\r') {
      line.erase(line.length() - 1);
    }

    if (strip(line).length() == 0) {
      if (!empty) {
        sentences.push_back(current);
      }
      current = ConllSentence();
      empty = true;
    }
    else if (line[0] == '#') {
      current.AddComment(line);
      empty = false;
    }
    else {
      current.AddLine(tokenize(line, '\t'));
      empty = false;
    }
  }

  if (!empty) {
    sentences.push_back(current);
  }
}

void ConllDocument::Write(ostream& out) const {
  for (const ConllSentence& sentence : sentences) {
    sentence.Write(out);
  }
}

ConllDocument ConllDocument::ReadFile(const string& filename) {
  ifstream f(filename);
  if (!f.is_open()) {
    throw runtime_error("Unable to open " + filename + " for reading.");
  }

  ConllDocument document;
  document.Read(f);
  return document;
}

void ConllDocument::WriteFile(const string& filename) const {
  ofstream f(filename);
  if (!f.is_open()) {
    throw runtime_error("Unable to open " + filename + " for writing.");
  }

  Write(f);
  f.close();
  if (f.fail()) {
    throw runtime_error("Failed while writing " + filename);
  }
}
