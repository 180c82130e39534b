#pragma once
#include <vector>
#include <string>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/access.hpp>
#include <boost/serialization/vector.hpp>
#include "dynet/dynet.h"
#include "config.h"
#include "vocab.h"

using namespace std;
using namespace dynet;

// Everything needed to rebuild a trained parser. Parameter values are stored
// in the order the parser creates its parameters.
struct Checkpoint {
  ParserConfig config;
  MultiVocab vocab;
  vector<vector<float>> parameters;
  vector<vector<float>> lookup_parameters;

private:
  friend class boost::serialization::access;
  template<class Archive>
  void serialize(Archive& ar, const unsigned int) {
    ar & config;
    ar & vocab;
    ar & parameters;
    ar & lookup_parameters;
  }
};

// Writes to a temporary file first, so an existing checkpoint survives a failed write
void Serialize(const string& filename, const ParserConfig& config, const MultiVocab& vocab, ParameterCollection& model);
Checkpoint Deserialize(const string& filename);
// Copies the stored values into a model built from checkpoint.config
void RestoreParameters(const Checkpoint& checkpoint, ParameterCollection& model);
// Copies the values of every parameter in source into the parameter at the
// same position in target. Both collections must have the same layout.
void CopyParameters(ParameterCollection& source, ParameterCollection& target);
