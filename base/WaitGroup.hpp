#pragma once

#include "base/Mutex.hpp"

namespace sketchdb {
namespace base {

class WaitGroup : boost::noncopyable {
 private:
  MutexLock mutex_;
  Condition cond_;
  int count_;

 public:
  WaitGroup() : cond_(mutex_), count_(0) {}

  void add(int n) {
    MutexLockGuard lock(mutex_);
    count_ += n;
  }

  void done() {
    MutexLockGuard lock(mutex_);
    --count_;
    if (count_ <= 0) cond_.notify_all();
  }

  void wait() {
    MutexLockGuard lock(mutex_);
    while (count_ > 0) cond_.wait();
  }
};

// WaitGroupGuard calls done() when it goes out of scope, also when the task
// throws.
class WaitGroupGuard : boost::noncopyable {
 private:
  WaitGroup* wg_;

 public:
  explicit WaitGroupGuard(WaitGroup* wg) : wg_(wg) {}
  ~WaitGroupGuard() { wg_->done(); }
};

}  // namespace base
}  // namespace sketchdb
