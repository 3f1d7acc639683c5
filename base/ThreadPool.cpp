#include "base/ThreadPool.hpp"

#include <exception>

#include "base/Logging.hpp"

namespace sketchdb {
namespace base {

ThreadPool::ThreadPool(int num_threads, size_t max_queue_size,
                       const std::string& name)
    : not_empty_(mutex_),
      not_full_(mutex_),
      name_(name),
      max_queue_size_(max_queue_size),
      running_(true) {
  if (num_threads < 1) num_threads = 1;
  threads_.reserve(num_threads);
  for (int i = 0; i < num_threads; i++)
    threads_.emplace_back(
        new std::thread(std::bind(&ThreadPool::run_in_thread, this)));
}

ThreadPool::~ThreadPool() {
  if (running_) stop();
}

void ThreadPool::stop() {
  {
    MutexLockGuard lock(mutex_);
    running_ = false;
    not_empty_.notify_all();
    not_full_.notify_all();
  }
  for (auto& t : threads_) {
    if (t->joinable()) t->join();
  }
}

size_t ThreadPool::queue_size() const {
  MutexLockGuard lock(mutex_);
  return queue_.size();
}

bool ThreadPool::run(Task task) {
  MutexLockGuard lock(mutex_);
  while (running_ && full()) not_full_.wait();
  if (!running_) {
    LOG_WARN << "pool=" << name_ << " task dropped after stop";
    return false;
  }
  queue_.push_back(std::move(task));
  not_empty_.notify();
  return true;
}

ThreadPool::Task ThreadPool::take() {
  MutexLockGuard lock(mutex_);
  while (queue_.empty() && running_) not_empty_.wait();
  Task task;
  if (!queue_.empty()) {
    task = std::move(queue_.front());
    queue_.pop_front();
    if (max_queue_size_ > 0) not_full_.notify();
  }
  return task;
}

bool ThreadPool::full() const {
  return max_queue_size_ > 0 && queue_.size() >= max_queue_size_;
}

void ThreadPool::run_in_thread() {
  while (true) {
    Task task(take());
    if (!task) {
      MutexLockGuard lock(mutex_);
      if (!running_ && queue_.empty()) break;
      continue;
    }
    try {
      task();
    } catch (const std::exception& ex) {
      LOG_ERROR << "pool=" << name_ << " task threw: " << ex.what();
    }
  }
}

}  // namespace base
}  // namespace sketchdb
