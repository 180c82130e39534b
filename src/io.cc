#include <cstdio>
#include <fstream>
#include <stdexcept>
#include "dynet/tensor.h"
#include "io.h"

void Serialize(const string& filename, const ParserConfig& config, const MultiVocab& vocab, ParameterCollection& model) {
  Checkpoint checkpoint;
  checkpoint.config = config;
  checkpoint.vocab = vocab;
  for (const auto& p : model.parameters_list()) {
    checkpoint.parameters.push_back(as_vector(p->values));
  }
  for (const auto& p : model.lookup_parameters_list()) {
    checkpoint.lookup_parameters.push_back(as_vector(p->all_values));
  }

  const string temp_filename = filename + ".tmp";
  {
    ofstream f(temp_filename, ios::binary);
    if (!f.is_open()) {
      throw runtime_error("Unable to open " + temp_filename + " for writing.");
    }
    boost::archive::binary_oarchive oa(f);
    oa & checkpoint;
    f.flush();
    if (f.fail()) {
      throw runtime_error("Failed while writing " + temp_filename);
    }
  }

  if (rename(temp_filename.c_str(), filename.c_str()) != 0) {
    throw runtime_error("Unable to move " + temp_filename + " to " + filename);
  }
}

Checkpoint Deserialize(const string& filename) {
  ifstream f(filename, ios::binary);
  if (!f.is_open()) {
    throw runtime_error("Unable to open " + filename + " for reading.");
  }

  Checkpoint checkpoint;
  try {
    boost::archive::binary_iarchive ia(f);
    ia & checkpoint;
  }
  catch (const boost::archive::archive_exception& e) {
    throw runtime_error("Unable to read checkpoint " + filename + ": " + e.what());
  }
  return checkpoint;
}

void RestoreParameters(const Checkpoint& checkpoint, ParameterCollection& model) {
  const auto& parameters = model.parameters_list();
  const auto& lookup_parameters = model.lookup_parameters_list();
  if (parameters.size() != checkpoint.parameters.size() || lookup_parameters.size() != checkpoint.lookup_parameters.size()) {
    throw runtime_error("Checkpoint does not match the model: different number of parameters");
  }

  for (unsigned i = 0; i < parameters.size(); ++i) {
    if (parameters[i]->values.d.size() != checkpoint.parameters[i].size()) {
      throw runtime_error("Checkpoint does not match the model: parameter " + to_string(i) + " has the wrong size");
    }
    TensorTools::set_elements(parameters[i]->values, checkpoint.parameters[i]);
  }

  for (unsigned i = 0; i < lookup_parameters.size(); ++i) {
    if (lookup_parameters[i]->all_values.d.size() != checkpoint.lookup_parameters[i].size()) {
      throw runtime_error("Checkpoint does not match the model: lookup parameter " + to_string(i) + " has the wrong size");
    }
    TensorTools::set_elements(lookup_parameters[i]->all_values, checkpoint.lookup_parameters[i]);
  }
}

void CopyParameters(ParameterCollection& source, ParameterCollection& target) {
  const auto& source_parameters = source.parameters_list();
  const auto& target_parameters = target.parameters_list();
  const auto& source_lookups = source.lookup_parameters_list();
  const auto& target_lookups = target.lookup_parameters_list();
  if (source_parameters.size() != target_parameters.size() || source_lookups.size() != target_lookups.size()) {
    throw runtime_error("Unable to copy parameters between collections with different layouts");
  }

  for (unsigned i = 0; i < target_parameters.size(); ++i) {
    if (source_parameters[i]->values.d.size() != target_parameters[i]->values.d.size()) {
      throw runtime_error("Unable to copy parameter " + to_string(i) + ": sizes differ");
    }
    TensorTools::set_elements(target_parameters[i]->values, as_vector(source_parameters[i]->values));
  }

  for (unsigned i = 0; i < target_lookups.size(); ++i) {
    if (source_lookups[i]->all_values.d.size() != target_lookups[i]->all_values.d.size()) {
      throw runtime_error("Unable to copy lookup parameter " + to_string(i) + ": sizes differ");
    }
    TensorTools::set_elements(target_lookups[i]->all_values, as_vector(source_lookups[i]->all_values));
  }
}
