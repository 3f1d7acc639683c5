#ifndef SKETCHINSTANCE_H
#define SKETCHINSTANCE_H

#include <memory>

#include "base/Mutex.hpp"
#include "label/Label.hpp"
#include "partition/PartitionUtils.hpp"
#include "sketch/SketchInterface.hpp"

namespace sketchdb {
namespace partition {

class EvalResult {
 public:
  Coverage coverage;
  sketch::Vector vector;
  sketch::Annotations annotations;

  EvalResult() : coverage(UNCOVERED) {}
};

// SketchInstance is the sketch of one (series, function) pair together with
// its coverage interval [min_time, max_time]. Inserts take the writer lock,
// so inserts of the same key are applied in arrival order.
class SketchInstance : boost::noncopyable {
 private:
  base::RWMutexLock mutex_;
  std::unique_ptr<sketch::SketchInterface> sketch_;
  int64_t min_time_;
  int64_t max_time_;
  uint64_t num_samples_;

  Coverage coverage_locked(int64_t mint, int64_t maxt) const;

 public:
  const label::Labels labels;
  const sketch::FunctionDesc* const fn;

  SketchInstance(const label::Labels& labels, const sketch::FunctionDesc* fn,
                 const sketch::SketchOptions& opts);

  error::Error insert(int64_t t, double v);

  // Writer lock, the one insert() holds.
  void lock() { mutex_.write_lock(); }
  void unlock() { mutex_.unlock(); }

  // Returns false if the reader lock was not acquired within timeout_ms.
  bool coverage(int64_t mint, int64_t maxt, int64_t timeout_ms, Coverage* c);

  // evaluate checks coverage and, only when [mint, maxt] is covered, runs
  // query_fn on the sketch. Returns false on lock timeout.
  bool evaluate(const sketch::FunctionDesc* query_fn, double arg, int64_t mint,
                int64_t maxt, int64_t now, int64_t timeout_ms,
                EvalResult* result);

  int64_t min_time();
  int64_t max_time();
  uint64_t num_samples();
};

}  // namespace partition
}  // namespace sketchdb

#endif
