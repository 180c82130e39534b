#include <stdexcept>
#include "evaluator.h"
#include "learner.h"
#include "vocab.h"
#include "attachment_score.h"

vector<SentencePrediction> PredictAll(Learner& learner, const BatchProvider& data) {
  vector<SentencePrediction> predictions;
  for (unsigned i = 0; i < data.size(); ++i) {
    vector<SentencePrediction> batch_predictions = learner.Predict(data[i]);
    predictions.insert(predictions.end(), batch_predictions.begin(), batch_predictions.end());
  }
  return predictions;
}

void WritePredictions(const vector<SentencePrediction>& predictions, const Vocab& deprel_vocab, ConllDocument& document) {
  for (const SentencePrediction& prediction : predictions) {
    if (prediction.index >= document.NumSentences()) {
      throw out_of_range("Prediction for sentence " + to_string(prediction.index) + " of a document with " + to_string(document.NumSentences()) + " sentences");
    }

    ConllSentence& sentence = document[prediction.index];
    vector<int> heads = prediction.Heads();
    for (unsigned i = 1; i < heads.size(); ++i) {
      WordId label = prediction.labels[i][heads[i]];
      sentence.Set(i - 1, kHead, to_string(heads[i]));
      sentence.Set(i - 1, kDeprel, (label == kPadId) ? kEmptySlot : deprel_vocab.Convert(label));
    }
  }
}

ConllEvaluator::ConllEvaluator(const BatchProvider& data, const ConllDocument& document, const Vocab& deprel_vocab, const string& output_file, const string& gold_file) :
  data(data), document(document), deprel_vocab(deprel_vocab), output_file(output_file), gold_file(gold_file) {}

bool ConllEvaluator::HasData() const {
  return data.size() > 0;
}

EvaluationResult ConllEvaluator::Evaluate(Learner& learner) {
  EvaluationResult result;
  result.predictions = PredictAll(learner, data);
  WritePredictions(result.predictions, deprel_vocab, document);
  document.WriteFile(output_file);
  result.score = ScoreAttachments(output_file, gold_file).LAS();
  return result;
}
