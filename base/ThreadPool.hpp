#ifndef THREADPOOL_H
#define THREADPOOL_H

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "base/Mutex.hpp"

namespace sketchdb {
namespace base {

// ThreadPool runs tasks on a fixed set of threads. With a positive
// max_queue_size, run() blocks the caller while the queue is full, which is
// what bounds the work in flight.
class ThreadPool : boost::noncopyable {
 public:
  typedef std::function<void()> Task;

  explicit ThreadPool(int num_threads, size_t max_queue_size = 0,
                      const std::string& name = "pool");
  ~ThreadPool();

  // Returns false if the pool was stopped and the task was dropped.
  bool run(Task task);
  void stop();

  size_t queue_size() const;
  int num_threads() const { return static_cast<int>(threads_.size()); }
  const std::string& name() const { return name_; }

 private:
  bool full() const;
  void run_in_thread();
  Task take();

  mutable MutexLock mutex_;
  Condition not_empty_;
  Condition not_full_;
  std::string name_;
  std::vector<std::unique_ptr<std::thread>> threads_;
  std::deque<Task> queue_;
  size_t max_queue_size_;
  bool running_;
};

}  // namespace base
}  // namespace sketchdb

#endif
