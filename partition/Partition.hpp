#ifndef PARTITION_H
#define PARTITION_H

#include <atomic>
#include <string>
#include <vector>

#include "partition/IngestBatch.hpp"
#include "partition/StripeSketches.hpp"

class PartitionSummary;

namespace sketchdb {
namespace partition {

class PartitionOptions {
 public:
  int index;
  std::string host;
  int port;
  int64_t machine_begin;  // Inclusive.
  int64_t machine_end;    // Exclusive.
  std::vector<const sketch::FunctionDesc*> functions;
  sketch::SketchOptions sketch_options;
  std::string metric_label;
  std::string machine_label;

  PartitionOptions()
      : index(0),
        host("127.0.0.1"),
        port(0),
        machine_begin(0),
        machine_end(0),
        metric_label(label::METRIC_NAME),
        machine_label("machineid") {}
};

// Partition owns the sketch instances of the machines in
// [machine_begin, machine_end). Instances are created on first insert or by
// preallocate() and are never dropped.
class Partition : boost::noncopyable {
 private:
  PartitionOptions opts_;
  StripeSketches sketches_;

  std::atomic<uint64_t> ingested_total_;
  std::atomic<uint64_t> failed_total_;
  std::atomic<int64_t> last_insert_ms_;

 public:
  explicit Partition(const PartitionOptions& opts);

  const PartitionOptions& options() const { return opts_; }

  bool owns(int64_t machine_idx) const {
    return machine_idx >= opts_.machine_begin && machine_idx < opts_.machine_end;
  }

  // identity returns the series labels of a sample, the metric name merged
  // into its labels.
  label::Labels identity(const std::string& metric,
                         const label::Labels& lset) const;

  // ingest inserts every sample of the batch into the sketches of all
  // configured functions. Failing samples are logged and skipped. Returns the
  // number of samples whose inserts all succeeded.
  int ingest(const IngestBatch& batch);

  error::Error insert(int64_t t, const MetricSample& m);

  // preallocate creates the instances of machine_<i> for every i in range
  // below num_series. Returns the number of instances created.
  int preallocate(int64_t num_series, const std::string& metric);

  // lookup returns the instance answering fn for the series, nullptr if the
  // function is not enabled or the series has not been seen.
  std::shared_ptr<SketchInstance> lookup(const label::Labels& identity,
                                         const sketch::FunctionDesc* fn);

  void summary(PartitionSummary* pb);

  size_t num_sketches() { return sketches_.size(); }
  uint64_t ingested_total() const { return ingested_total_.load(); }
  uint64_t failed_total() const { return failed_total_.load(); }
  int64_t last_insert_ms() const { return last_insert_ms_.load(); }
};

}  // namespace partition
}  // namespace sketchdb

#endif
