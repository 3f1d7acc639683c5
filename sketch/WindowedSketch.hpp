#ifndef WINDOWEDSKETCH_H
#define WINDOWEDSKETCH_H

#include <deque>
#include <map>

#include "sketch/SketchInterface.hpp"

namespace sketchdb {
namespace sketch {

extern const int BUCKETS_PER_WINDOW;
extern const double VALUE_RESOLUTION_STEPS;

extern const error::Error ErrInvalidValue;
extern const error::Error ErrOutOfOrder;

// WindowedSketch summarizes a sliding window of samples in fixed-width time
// buckets. Every bucket keeps moments; quantile and frequency sketches also
// keep a histogram of values quantized to value_scale / VALUE_RESOLUTION_STEPS.
// Raw samples are never stored.
class WindowedSketch : public SketchInterface {
 private:
  struct Bucket {
    int64_t start;
    int64_t min_t;
    int64_t max_t;
    uint64_t count;
    double sum;
    double sum2;
    double min;
    double max;
    std::map<int64_t, uint64_t> hist;

    explicit Bucket(int64_t start);
    void add(int64_t t, double v, int64_t key, bool with_hist);
    void merge(const Bucket& b, bool with_hist);
  };

  SketchKind kind_;
  SketchOptions opts_;
  int64_t bucket_width_;
  double resolution_;
  bool with_hist_;

  std::deque<Bucket> buckets_;
  uint64_t retained_;

  int64_t bucket_start(int64_t t) const;
  int64_t quantize(double v) const;
  void evict(int64_t newest);

  double quantile(const Bucket& agg, double q) const;
  double value_at(const Bucket& agg, uint64_t idx) const;

 public:
  WindowedSketch(SketchKind kind, const SketchOptions& opts);

  error::Error insert(int64_t t, double v) override;
  bool covered(int64_t mint, int64_t maxt) const override;
  Vector eval(const FunctionDesc* fn, double arg, int64_t mint, int64_t maxt,
              int64_t now, Annotations* annotations) const override;

  SketchKind kind() const override { return kind_; }
  uint64_t retained() const override { return retained_; }

  int64_t bucket_width() const { return bucket_width_; }
  size_t num_buckets() const { return buckets_.size(); }
};

}  // namespace sketch
}  // namespace sketchdb

#endif
