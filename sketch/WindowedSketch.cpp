#include "sketch/WindowedSketch.hpp"

#include <algorithm>
#include <cmath>

namespace sketchdb {
namespace sketch {

const int BUCKETS_PER_WINDOW = 60;
const double VALUE_RESOLUTION_STEPS = 100000;

const error::Error ErrInvalidValue("invalid sample value");
const error::Error ErrOutOfOrder("out of order sample");

std::unique_ptr<SketchInterface> new_sketch(SketchKind kind,
                                            const SketchOptions& opts) {
  return std::unique_ptr<SketchInterface>(new WindowedSketch(kind, opts));
}

WindowedSketch::Bucket::Bucket(int64_t start)
    : start(start),
      min_t(std::numeric_limits<int64_t>::max()),
      max_t(std::numeric_limits<int64_t>::min()),
      count(0),
      sum(0),
      sum2(0),
      min(std::numeric_limits<double>::infinity()),
      max(-std::numeric_limits<double>::infinity()) {}

void WindowedSketch::Bucket::add(int64_t t, double v, int64_t key,
                                 bool with_hist) {
  min_t = std::min(min_t, t);
  max_t = std::max(max_t, t);
  ++count;
  sum += v;
  sum2 += v * v;
  min = std::min(min, v);
  max = std::max(max, v);
  if (with_hist) ++hist[key];
}

void WindowedSketch::Bucket::merge(const Bucket& b, bool with_hist) {
  min_t = std::min(min_t, b.min_t);
  max_t = std::max(max_t, b.max_t);
  count += b.count;
  sum += b.sum;
  sum2 += b.sum2;
  min = std::min(min, b.min);
  max = std::max(max, b.max);
  if (with_hist) {
    for (const auto& p : b.hist) hist[p.first] += p.second;
  }
}

WindowedSketch::WindowedSketch(SketchKind kind, const SketchOptions& opts)
    : kind_(kind),
      opts_(opts),
      bucket_width_(std::max<int64_t>(1, opts.time_window / BUCKETS_PER_WINDOW)),
      resolution_(opts.value_scale > 0
                      ? opts.value_scale / VALUE_RESOLUTION_STEPS
                      : 1.0),
      with_hist_(kind != KIND_MOMENTS),
      retained_(0) {}

int64_t WindowedSketch::bucket_start(int64_t t) const {
  if (t >= 0) return t - t % bucket_width_;
  return ((t - bucket_width_ + 1) / bucket_width_) * bucket_width_;
}

int64_t WindowedSketch::quantize(double v) const {
  double k = std::floor(v / resolution_);
  const double lim = 9.0e18;
  if (k > lim) k = lim;
  if (k < -lim) k = -lim;
  return static_cast<int64_t>(k);
}

error::Error WindowedSketch::insert(int64_t t, double v) {
  if (!std::isfinite(v)) return ErrInvalidValue;
  if (!buckets_.empty() && t < buckets_.back().max_t) return ErrOutOfOrder;

  int64_t start = bucket_start(t);
  if (buckets_.empty() || start > buckets_.back().start)
    buckets_.emplace_back(start);
  buckets_.back().add(t, v, with_hist_ ? quantize(v) : 0, with_hist_);
  ++retained_;

  evict(t);
  return error::Error();
}

void WindowedSketch::evict(int64_t newest) {
  // The newest bucket always survives.
  while (buckets_.size() > 1 &&
         buckets_.front().max_t < newest - opts_.time_window) {
    retained_ -= buckets_.front().count;
    buckets_.pop_front();
  }
  while (buckets_.size() > 1 && opts_.item_window > 0 &&
         retained_ > static_cast<uint64_t>(opts_.item_window)) {
    retained_ -= buckets_.front().count;
    buckets_.pop_front();
  }
}

bool WindowedSketch::covered(int64_t mint, int64_t maxt) const {
  if (buckets_.empty() || mint > maxt) return false;
  return mint >= buckets_.front().min_t && maxt <= buckets_.back().max_t;
}

double WindowedSketch::value_at(const Bucket& agg, uint64_t idx) const {
  uint64_t cum = 0;
  for (const auto& p : agg.hist) {
    cum += p.second;
    if (cum > idx) {
      double v = (static_cast<double>(p.first) + 0.5) * resolution_;
      return std::min(agg.max, std::max(agg.min, v));
    }
  }
  return agg.max;
}

double WindowedSketch::quantile(const Bucket& agg, double q) const {
  if (agg.count == 0) return std::nan("");
  if (q <= 0) return agg.min;
  if (q >= 1) return agg.max;
  double rank = q * static_cast<double>(agg.count - 1);
  uint64_t lo = static_cast<uint64_t>(std::floor(rank));
  uint64_t hi = static_cast<uint64_t>(std::ceil(rank));
  double v_lo = value_at(agg, lo);
  if (hi == lo) return v_lo;
  double v_hi = value_at(agg, hi);
  return v_lo + (v_hi - v_lo) * (rank - static_cast<double>(lo));
}

Vector WindowedSketch::eval(const FunctionDesc* fn, double arg, int64_t mint,
                            int64_t maxt, int64_t now,
                            Annotations* annotations) const {
  // Buckets are aged by sample time, so the wall clock is not consulted.
  (void)now;

  Bucket agg(0);
  for (const auto& b : buckets_) {
    if (b.max_t < mint || b.min_t > maxt) continue;
    agg.merge(b, with_hist_);
  }
  if (annotations)
    (*annotations)["sketch_exec_sample_count"] = std::to_string(agg.count);

  double nan = std::nan("");
  if (agg.count == 0) return Vector({Sample(maxt, nan)});

  if (fn->kind != KIND_MOMENTS && !with_hist_) {
    if (annotations)
      (*annotations)["warning"] = std::string(fn->name) +
                                  " is not answerable from a " +
                                  kind_name(kind_) + " sketch";
    return Vector({Sample(maxt, nan)});
  }

  double n = static_cast<double>(agg.count);
  double v = nan;
  switch (fn->type) {
    case FN_AVG:
      v = agg.sum / n;
      break;
    case FN_COUNT:
      v = n;
      break;
    case FN_SUM:
      v = agg.sum;
      break;
    case FN_SUM2:
      v = agg.sum2;
      break;
    case FN_MIN:
      v = agg.min;
      break;
    case FN_MAX:
      v = agg.max;
      break;
    case FN_STDVAR:
    case FN_STDDEV: {
      double mean = agg.sum / n;
      double var = std::max(0.0, agg.sum2 / n - mean * mean);
      v = fn->type == FN_STDVAR ? var : std::sqrt(var);
      break;
    }
    case FN_QUANTILE:
      v = quantile(agg, arg);
      break;
    case FN_ENTROPY: {
      double h = 0;
      for (const auto& p : agg.hist) {
        double pr = static_cast<double>(p.second) / n;
        h -= pr * std::log2(pr);
      }
      v = h;
      break;
    }
    case FN_DISTINCT:
      v = static_cast<double>(agg.hist.size());
      break;
    case FN_L1:
      v = n;
      break;
    case FN_L2: {
      double s = 0;
      for (const auto& p : agg.hist)
        s += static_cast<double>(p.second) * static_cast<double>(p.second);
      v = std::sqrt(s);
      break;
    }
  }
  return Vector({Sample(maxt, v)});
}

}  // namespace sketch
}  // namespace sketchdb
