#include "partition/SketchInstance.hpp"

#include <cmath>
#include <limits>

namespace sketchdb {
namespace partition {

SketchInstance::SketchInstance(const label::Labels& labels,
                               const sketch::FunctionDesc* fn,
                               const sketch::SketchOptions& opts)
    : sketch_(sketch::new_sketch(fn->kind, opts)),
      min_time_(std::numeric_limits<int64_t>::max()),
      max_time_(std::numeric_limits<int64_t>::min()),
      num_samples_(0),
      labels(labels),
      fn(fn) {}

error::Error SketchInstance::insert(int64_t t, double v) {
  if (!std::isfinite(v)) return ErrInvalidValue;
  base::RWLockGuard lock(mutex_, 1);
  if (num_samples_ > 0 && t < max_time_) return ErrOutOfOrderSample;
  error::Error err = sketch_->insert(t, v);
  if (err) return err;
  if (num_samples_ == 0) min_time_ = t;
  max_time_ = t;
  ++num_samples_;
  return error::Error();
}

Coverage SketchInstance::coverage_locked(int64_t mint, int64_t maxt) const {
  if (num_samples_ == 0 || mint > maxt || maxt < min_time_ ||
      mint > max_time_)
    return UNCOVERED;
  if (mint >= min_time_ && maxt <= max_time_ && sketch_->covered(mint, maxt))
    return COVERED;
  return PARTIAL;
}

bool SketchInstance::coverage(int64_t mint, int64_t maxt, int64_t timeout_ms,
                              Coverage* c) {
  if (!mutex_.try_read_lock_for(timeout_ms)) return false;
  *c = coverage_locked(mint, maxt);
  mutex_.unlock();
  return true;
}

bool SketchInstance::evaluate(const sketch::FunctionDesc* query_fn, double arg,
                              int64_t mint, int64_t maxt, int64_t now,
                              int64_t timeout_ms, EvalResult* result) {
  if (!mutex_.try_read_lock_for(timeout_ms)) return false;
  result->coverage = coverage_locked(mint, maxt);
  if (result->coverage == COVERED)
    result->vector = sketch_->eval(query_fn, arg, mint, maxt, now,
                                   &result->annotations);
  mutex_.unlock();
  return true;
}

int64_t SketchInstance::min_time() {
  base::RWLockGuard lock(mutex_, 0);
  return min_time_;
}

int64_t SketchInstance::max_time() {
  base::RWLockGuard lock(mutex_, 0);
  return max_time_;
}

uint64_t SketchInstance::num_samples() {
  base::RWLockGuard lock(mutex_, 0);
  return num_samples_;
}

}  // namespace partition
}  // namespace sketchdb
