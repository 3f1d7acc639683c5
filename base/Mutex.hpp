#ifndef MUTEX_H
#define MUTEX_H

#include <errno.h>
#include <pthread.h>
#include <time.h>

#include <boost/noncopyable.hpp>
#include <cstdint>

namespace sketchdb {
namespace base {

class MutexLock : boost::noncopyable {
 public:
  MutexLock() { pthread_mutex_init(&mutex_, NULL); }
  ~MutexLock() { pthread_mutex_destroy(&mutex_); }

  void lock() { pthread_mutex_lock(&mutex_); }
  void unlock() { pthread_mutex_unlock(&mutex_); }

  pthread_mutex_t* get_pthread_mutex() { return &mutex_; }

 private:
  pthread_mutex_t mutex_;
};

class MutexLockGuard : boost::noncopyable {
 public:
  explicit MutexLockGuard(MutexLock& mutex) : mutex_(mutex) { mutex_.lock(); }
  ~MutexLockGuard() { mutex_.unlock(); }

 private:
  MutexLock& mutex_;
};

class Condition : boost::noncopyable {
 public:
  explicit Condition(MutexLock& mutex) : mutex_(mutex) {
    pthread_cond_init(&pcond_, NULL);
  }
  ~Condition() { pthread_cond_destroy(&pcond_); }

  void wait() { pthread_cond_wait(&pcond_, mutex_.get_pthread_mutex()); }

  // Returns true if time out.
  bool wait_for_millis(int64_t ms) {
    struct timespec abstime;
    clock_gettime(CLOCK_REALTIME, &abstime);
    abstime.tv_sec += static_cast<time_t>(ms / 1000);
    abstime.tv_nsec += static_cast<long>((ms % 1000) * 1000000);
    if (abstime.tv_nsec >= 1000000000) {
      abstime.tv_sec += 1;
      abstime.tv_nsec -= 1000000000;
    }
    return ETIMEDOUT == pthread_cond_timedwait(
                            &pcond_, mutex_.get_pthread_mutex(), &abstime);
  }

  void notify() { pthread_cond_signal(&pcond_); }
  void notify_all() { pthread_cond_broadcast(&pcond_); }

 private:
  MutexLock& mutex_;
  pthread_cond_t pcond_;
};

// RWMutexLock wraps pthread_rwlock_t. Writers are preferred so that a stream
// of readers cannot starve structural changes.
class RWMutexLock : boost::noncopyable {
 public:
  RWMutexLock() {
    pthread_rwlockattr_t attr;
    pthread_rwlockattr_init(&attr);
    pthread_rwlockattr_setkind_np(&attr,
                                  PTHREAD_RWLOCK_PREFER_WRITER_NONRECURSIVE_NP);
    pthread_rwlock_init(&rwlock_, &attr);
    pthread_rwlockattr_destroy(&attr);
  }
  ~RWMutexLock() { pthread_rwlock_destroy(&rwlock_); }

  void read_lock() { pthread_rwlock_rdlock(&rwlock_); }
  void write_lock() { pthread_rwlock_wrlock(&rwlock_); }
  void unlock() { pthread_rwlock_unlock(&rwlock_); }

  // Returns false when the read lock could not be taken within ms.
  bool try_read_lock_for(int64_t ms) {
    struct timespec abstime;
    clock_gettime(CLOCK_REALTIME, &abstime);
    abstime.tv_sec += static_cast<time_t>(ms / 1000);
    abstime.tv_nsec += static_cast<long>((ms % 1000) * 1000000);
    if (abstime.tv_nsec >= 1000000000) {
      abstime.tv_sec += 1;
      abstime.tv_nsec -= 1000000000;
    }
    return pthread_rwlock_timedrdlock(&rwlock_, &abstime) == 0;
  }

 private:
  pthread_rwlock_t rwlock_;
};

// To align cache line.
class PadRWMutexLock : public RWMutexLock {
 private:
  char pad_[64 - sizeof(pthread_rwlock_t) % 64];
};

// RWLockGuard takes the write lock when write != 0.
class RWLockGuard : boost::noncopyable {
 public:
  RWLockGuard(RWMutexLock& mutex, int write) : mutex_(mutex) {
    if (write)
      mutex_.write_lock();
    else
      mutex_.read_lock();
  }
  ~RWLockGuard() { mutex_.unlock(); }

 private:
  RWMutexLock& mutex_;
};

}  // namespace base
}  // namespace sketchdb

#endif
