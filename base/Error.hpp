#pragma once

#include <string>

namespace sketchdb {
namespace error {

// Error is a value type carrying a message. An empty Error means success.
class Error {
 private:
  std::string err_;

 public:
  Error() = default;
  explicit Error(const std::string& err) : err_(err) {}
  explicit Error(const char* err) : err_(err) {}

  void set(const std::string& err) { err_ = err; }

  const std::string& error() const { return err_; }

  explicit operator bool() const { return !err_.empty(); }

  bool operator==(const Error& e) const { return err_ == e.err_; }
  bool operator!=(const Error& e) const { return err_ != e.err_; }
};

inline Error wrap(const Error& err, const std::string& msg) {
  if (!err) return err;
  return Error(msg + ": " + err.error());
}

}  // namespace error
}  // namespace sketchdb
