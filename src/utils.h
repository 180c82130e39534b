#pragma once
#include <vector>
#include <string>
#include <chrono>
#include "dynet/dynet.h"
#include "dynet/expr.h"

using namespace std;
using namespace dynet;

typedef int WordId;

unsigned int UTF8Len(unsigned char x);
vector<string> UTF8Split(const string& x);

vector<string> tokenize(string input, string delimiter, unsigned max_times);
vector<string> tokenize(string input, string delimiter);
vector<string> tokenize(string input, char delimiter);

string strip(const string& input);
vector<string> strip(const vector<string>& input, bool removeEmpty = false);
string lowercase(const string& input);

vector<Expression> MakeLSTMInitialState(Expression c, unsigned lstm_dim, unsigned lstm_layer_count);

typedef std::chrono::steady_clock::time_point time_point;
time_point GetTime();
double GetSeconds(const time_point& start, const time_point& end);
