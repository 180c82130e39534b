#include <vector>
#include <boost/algorithm/string.hpp>
#include "utils.h"

using namespace std;

// given the first character of a UTF8 block, find out how wide it is
// see http://en.wikipedia.org/wiki/UTF-8 for more info
unsigned int UTF8Len(unsigned char x) {
  if (x < 0x80) return 1;
  else if ((x >> 5) == 0x06) return 2;
  else if ((x >> 4) == 0x0e) return 3;
  else if ((x >> 3) == 0x1e) return 4;
  else if ((x >> 2) == 0x3e) return 5;
  else if ((x >> 1) == 0x7e) return 6;
  else return 0;
}

vector<string> UTF8Split(const string& x) {
  vector<string> chars;
  unsigned pos = 0;
  while (pos < x.size()) {
    unsigned len = UTF8Len(x[pos]);
    // Stray continuation bytes are kept as single characters
    if (len == 0 || pos + len > x.size()) {
      len = 1;
    }
    chars.push_back(x.substr(pos, len));
    pos += len;
  }
  return chars;
}

vector<string> tokenize(string input, string delimiter, unsigned max_times) {
  vector<string> tokens;
  size_t last = 0;
  size_t next = 0;
  while ((next = input.find(delimiter, last)) != string::npos && tokens.size() < max_times) {
    tokens.push_back(input.substr(last, next-last));
    last = next + delimiter.length();
  }
  tokens.push_back(input.substr(last));
  return tokens;
}

vector<string> tokenize(string input, string delimiter) {
  return tokenize(input, delimiter, input.length());
}

vector<string> tokenize(string input, char delimiter) {
  return tokenize(input, string(1, delimiter));
}

string strip(const string& input) {
  string output = input;
  boost::algorithm::trim(output);
  return output;
}

vector<string> strip(const vector<string>& input, bool removeEmpty) {
  vector<string> output;
  for (unsigned i = 0; i < input.size(); ++i) {
    string s = strip(input[i]);
    if (s.length() > 0 || !removeEmpty) {
      output.push_back(s);
    }
  }
  return output;
}

string lowercase(const string& input) {
  return boost::algorithm::to_lower_copy(input);
}

// Splits a single vector of size (2 * layers * lstm_dim) into the
// c and h initial states expected by the LSTM builders
vector<Expression> MakeLSTMInitialState(Expression c, unsigned lstm_dim, unsigned lstm_layer_count) {
  vector<Expression> init(lstm_layer_count * 2);
  for (unsigned i = 0; i < lstm_layer_count; ++i) {
    init[i] = pickrange(c, i * lstm_dim, (i + 1) * lstm_dim);
    init[i + lstm_layer_count] = tanh(init[i]);
  }
  return init;
}

time_point GetTime() {
  return chrono::steady_clock::now();
}

double GetSeconds(const time_point& start, const time_point& end) {
  double seconds = chrono::duration_cast<chrono::microseconds>(end - start).count() / 1000000.0;
  return seconds;
}
