#include "query/QueryParser.hpp"

#include <ctype.h>
#include <stdlib.h>

#include <limits>

namespace sketchdb {
namespace query {

namespace {

bool is_ident_start(char c) {
  return isalpha(static_cast<unsigned char>(c)) || c == '_' || c == ':';
}
bool is_ident_char(char c) {
  return isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':';
}
bool is_digit(char c) { return c >= '0' && c <= '9'; }

}  // namespace

error::Error QueryParser::errorf(const std::string& msg) const {
  return error::Error("parse error at position " + std::to_string(pos_) +
                      ": " + msg);
}

void QueryParser::skip_space() {
  while (pos_ < expr_.size() && isspace(static_cast<unsigned char>(expr_[pos_])))
    ++pos_;
}

bool QueryParser::at_end() {
  skip_space();
  return pos_ >= expr_.size();
}

bool QueryParser::peek(char c) {
  skip_space();
  return pos_ < expr_.size() && expr_[pos_] == c;
}

bool QueryParser::consume(char c) {
  if (!peek(c)) return false;
  ++pos_;
  return true;
}

std::string QueryParser::identifier() {
  skip_space();
  size_t start = pos_;
  if (pos_ < expr_.size() && is_ident_start(expr_[pos_])) {
    ++pos_;
    while (pos_ < expr_.size() && is_ident_char(expr_[pos_])) ++pos_;
  }
  return expr_.substr(start, pos_ - start);
}

error::Error QueryParser::number(double* v) {
  skip_space();
  const char* begin = expr_.c_str() + pos_;
  char* end = nullptr;
  *v = strtod(begin, &end);
  if (end == begin) return errorf("expected number");
  pos_ += end - begin;
  return error::Error();
}

error::Error QueryParser::quoted(std::string* s) {
  if (!consume('"')) return errorf("expected '\"'");
  s->clear();
  while (pos_ < expr_.size() && expr_[pos_] != '"') {
    if (expr_[pos_] == '\\' && pos_ + 1 < expr_.size()) ++pos_;
    s->push_back(expr_[pos_++]);
  }
  if (pos_ >= expr_.size()) return errorf("unterminated string");
  ++pos_;
  return error::Error();
}

error::Error QueryParser::matchers(label::Labels* lset) {
  if (consume('}')) return error::Error();
  while (true) {
    std::string name = identifier();
    if (name.empty()) return errorf("expected label name");
    skip_space();
    if (expr_.compare(pos_, 2, "!=") == 0 || expr_.compare(pos_, 2, "=~") == 0 ||
        expr_.compare(pos_, 2, "!~") == 0)
      return errorf("only equality matchers are supported");
    if (!consume('=')) return errorf("expected '=' after " + name);
    std::string value;
    error::Error err = quoted(&value);
    if (err) return err;
    lset->emplace_back(name, value);
    if (consume('}')) return error::Error();
    if (!consume(',')) return errorf("expected ',' or '}'");
    // Trailing comma.
    if (consume('}')) return error::Error();
  }
}

error::Error QueryParser::duration(int64_t* ms) {
  skip_space();
  size_t start = pos_;
  while (pos_ < expr_.size() && expr_[pos_] != ']') ++pos_;
  std::pair<int64_t, error::Error> d =
      parse_duration(expr_.substr(start, pos_ - start));
  if (d.second) return errorf(d.second.error());
  *ms = d.first;
  return error::Error();
}

error::Error QueryParser::parse(int64_t time, QueryRequest* req) {
  pos_ = 0;
  req->func = identifier();
  if (req->func.empty()) return errorf("expected function name");
  if (!consume('(')) return errorf("expected '('");

  skip_space();
  if (pos_ < expr_.size() && !is_ident_start(expr_[pos_])) {
    error::Error err = number(&req->arg);
    if (err) return err;
    req->has_arg = true;
    if (!consume(',')) return errorf("expected ',' after argument");
  }

  req->metric = identifier();
  if (req->metric.empty()) return errorf("expected metric name");

  req->labels.clear();
  if (consume('{')) {
    error::Error err = matchers(&req->labels);
    if (err) return err;
  }
  label::lbs_normalize(&req->labels);

  if (!consume('[')) return errorf("expected '['");
  int64_t window = 0;
  error::Error err = duration(&window);
  if (err) return err;
  if (!consume(']')) return errorf("expected ']'");
  if (!consume(')')) return errorf("expected ')'");
  if (!at_end()) return errorf("unexpected trailing input");

  if (time < std::numeric_limits<int64_t>::min() + window)
    return error::Error("evaluation time " + std::to_string(time) +
                        " out of range");
  req->maxt = time;
  req->mint = time - window;
  return error::Error();
}

std::pair<int64_t, error::Error> parse_duration(const std::string& s) {
  if (s.empty()) return {0, error::Error("empty duration")};
  int64_t total = 0;
  size_t i = 0;
  while (i < s.size()) {
    if (!is_digit(s[i]))
      return {0, error::Error("bad duration \"" + s + "\"")};
    int64_t n = 0;
    while (i < s.size() && is_digit(s[i])) {
      n = n * 10 + (s[i] - '0');
      if (n > (int64_t(1) << 40))
        return {0, error::Error("duration \"" + s + "\" too large")};
      ++i;
    }
    int64_t unit = 0;
    if (s.compare(i, 2, "ms") == 0) {
      unit = 1;
      i += 2;
    } else if (i < s.size()) {
      switch (s[i]) {
        case 's':
          unit = 1000;
          break;
        case 'm':
          unit = 60 * 1000;
          break;
        case 'h':
          unit = 3600 * 1000;
          break;
        case 'd':
          unit = 24 * 3600 * 1000;
          break;
        case 'w':
          unit = int64_t(7) * 24 * 3600 * 1000;
          break;
        case 'y':
          unit = int64_t(365) * 24 * 3600 * 1000;
          break;
      }
      if (unit > 0) ++i;
    }
    if (unit == 0)
      return {0, error::Error("bad duration unit in \"" + s + "\"")};
    if (n > (int64_t(1) << 62) / unit - total / unit)
      return {0, error::Error("duration \"" + s + "\" too large")};
    total += n * unit;
  }
  if (total <= 0) return {0, error::Error("duration must be positive")};
  return {total, error::Error()};
}

}  // namespace query
}  // namespace sketchdb
