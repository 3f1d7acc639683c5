#pragma once

#include <string>

#include "base/Error.hpp"
#include "label/Label.hpp"

namespace sketchdb {
namespace query {

class QueryRequest {
 public:
  std::string func;
  std::string metric;
  label::Labels labels;  // Equality filters, metric name excluded.
  int64_t mint;
  int64_t maxt;
  bool has_arg;
  double arg;

  QueryRequest() : mint(0), maxt(0), has_arg(false), arg(0) {}
};

// QueryParser parses expressions of the form
//   func([arg,] metric{name="value", ...}[duration])
// where duration is a sequence of <int><unit> with units ms, s, m, h, d, w, y.
// Only equality matchers are accepted.
class QueryParser {
 private:
  std::string expr_;
  size_t pos_;

  void skip_space();
  bool consume(char c);
  bool peek(char c);
  bool at_end();
  std::string identifier();
  error::Error number(double* v);
  error::Error quoted(std::string* s);
  error::Error matchers(label::Labels* lset);
  error::Error duration(int64_t* ms);
  error::Error errorf(const std::string& msg) const;

 public:
  explicit QueryParser(const std::string& expr) : expr_(expr), pos_(0) {}

  // parse fills req with maxt = time and mint = time - duration.
  error::Error parse(int64_t time, QueryRequest* req);
};

// parse_duration parses strings like "5m", "1h30m" or "500ms" into ms.
std::pair<int64_t, error::Error> parse_duration(const std::string& s);

}  // namespace query
}  // namespace sketchdb
