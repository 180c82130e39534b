#pragma once
#include <vector>
#include <string>
#include "batch.h"
#include "conll.h"
#include "parser.h"

using namespace std;

class Learner;
class Vocab;

struct EvaluationResult {
  float score;
  vector<SentencePrediction> predictions;
};

// Runs the model over one evaluation split and scores its output
class Evaluator {
public:
  virtual ~Evaluator() {}
  virtual bool HasData() const = 0;
  virtual EvaluationResult Evaluate(Learner& learner) = 0;
};

// Predicts every batch, writes the predictions into a copy of the input
// document, saves it to output_file and returns the LAS against gold_file
class ConllEvaluator : public Evaluator {
public:
  ConllEvaluator(const BatchProvider& data, const ConllDocument& document, const Vocab& deprel_vocab, const string& output_file, const string& gold_file);

  bool HasData() const override;
  EvaluationResult Evaluate(Learner& learner) override;

private:
  const BatchProvider& data;
  ConllDocument document;
  const Vocab& deprel_vocab;
  string output_file;
  string gold_file;
};

vector<SentencePrediction> PredictAll(Learner& learner, const BatchProvider& data);

// Sets the head and relation of every word from the predictions. The
// relation is the one predicted for the chosen head; label id 0 is written
// as "_".
void WritePredictions(const vector<SentencePrediction>& predictions, const Vocab& deprel_vocab, ConllDocument& document);
