#pragma once

#include <chrono>
#include <cstdint>

namespace sketchdb {
namespace base {

// Milliseconds since the Unix epoch.
inline int64_t now_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

class Timer {
 private:
  std::chrono::steady_clock::time_point start_;

 public:
  Timer() : start_(std::chrono::steady_clock::now()) {}

  void start() { start_ = std::chrono::steady_clock::now(); }

  int64_t since_start_nano() const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now() - start_)
        .count();
  }

  double since_start_millis() const { return since_start_nano() / 1e6; }
};

}  // namespace base
}  // namespace sketchdb
