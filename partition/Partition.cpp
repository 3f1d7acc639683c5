#include "partition/Partition.hpp"

#include <algorithm>
#include <cmath>

#include "base/Logging.hpp"
#include "base/TimeStamp.hpp"
#include "db/Partition.pb.h"

namespace sketchdb {
namespace partition {

Partition::Partition(const PartitionOptions& opts)
    : opts_(opts), ingested_total_(0), failed_total_(0), last_insert_ms_(0) {}

label::Labels Partition::identity(const std::string& metric,
                                  const label::Labels& lset) const {
  label::Builder b(lset);
  b.set(opts_.metric_label, metric);
  return b.labels();
}

error::Error Partition::insert(int64_t t, const MetricSample& m) {
  if (m.err) return m.err;
  if (m.name.empty()) return ErrMissingMetricName;
  if (!std::isfinite(m.value)) return ErrInvalidValue;

  label::Labels lset = identity(m.name, m.labels);
  std::pair<int64_t, bool> machine =
      label::parse_machine_index(label::lbs_get(lset, opts_.machine_label));
  if (!machine.second) return ErrMissingMachine;
  if (!owns(machine.first)) return ErrMachineOutOfRange;

  for (const sketch::FunctionDesc* fn : opts_.functions) {
    std::pair<std::shared_ptr<SketchInstance>, bool> p =
        sketches_.get_or_create(lset, fn, opts_.sketch_options);
    if (p.second)
      LOG_DEBUG << "partition " << opts_.index << " new sketch " << fn->name
                << " " << label::lbs_string(lset);
    error::Error err = p.first->insert(t, m.value);
    if (err) return error::wrap(err, fn->name);
  }
  return error::Error();
}

int Partition::ingest(const IngestBatch& batch) {
  int count = 0;
  for (const MetricSample& m : batch.metrics) {
    error::Error err = insert(batch.timestamp, m);
    if (err) {
      ++failed_total_;
      LOG_WARN << "partition " << opts_.index << " skip sample " << m.name
               << label::lbs_string(m.labels) << " t=" << batch.timestamp
               << " v=" << m.value << ": " << err.error();
      continue;
    }
    ++count;
  }
  if (count > 0) {
    ingested_total_ += count;
    last_insert_ms_.store(base::now_millis());
  }
  return count;
}

int Partition::preallocate(int64_t num_series, const std::string& metric) {
  int created = 0;
  int64_t end = std::min(num_series, opts_.machine_end);
  for (int64_t i = opts_.machine_begin; i < end; i++) {
    label::Labels lset = identity(
        metric, {{opts_.machine_label, "machine_" + std::to_string(i)}});
    for (const sketch::FunctionDesc* fn : opts_.functions) {
      if (sketches_.get_or_create(lset, fn, opts_.sketch_options).second)
        ++created;
    }
  }
  if (created > 0)
    LOG_INFO << "partition " << opts_.index << " preallocated " << created
             << " sketches";
  return created;
}

std::shared_ptr<SketchInstance> Partition::lookup(
    const label::Labels& identity, const sketch::FunctionDesc* fn) {
  const sketch::FunctionDesc* resolved =
      sketch::resolve_function(opts_.functions, fn);
  if (resolved == nullptr) return nullptr;
  return sketches_.get(identity, resolved);
}

void Partition::summary(PartitionSummary* pb) {
  pb->set_index(opts_.index);
  pb->set_host(opts_.host);
  pb->set_port(opts_.port);
  pb->set_machine_begin(opts_.machine_begin);
  pb->set_machine_end(opts_.machine_end);
  pb->set_ingested_total(ingested_total_.load());
  pb->set_failed_total(failed_total_.load());
  pb->set_last_insert_ms(last_insert_ms_.load());

  uint64_t n = 0;
  sketches_.iter([pb, &n, this](const std::shared_ptr<SketchInstance>& s) {
    ++n;
    InstanceSummary* is = pb->add_instances();
    is->set_machine(label::lbs_get(s->labels, opts_.machine_label));
    is->set_function(s->fn->name);
    is->set_labels(label::lbs_string(s->labels));
    uint64_t samples = s->num_samples();
    is->set_samples(samples);
    if (samples > 0) {
      is->set_min_time(s->min_time());
      is->set_max_time(s->max_time());
    }
  });
  pb->set_sketches(n);
}

}  // namespace partition
}  // namespace sketchdb
