#ifndef CONTROLPLANE_H
#define CONTROLPLANE_H

#include <memory>
#include <string>
#include <vector>

#include "db/Partition.pb.h"
#include "partition/PartitionServer.hpp"
#include "routing/PartitionTable.hpp"

namespace sketchdb {
namespace db {
class Metrics;
}
namespace ingest {
class IngestRouter;
}

namespace control {

class ControlOptions {
 public:
  int64_t machines_per_partition;  // Used when a registration names none.
  std::vector<const sketch::FunctionDesc*> functions;
  sketch::SketchOptions sketch_options;
  std::string metric_label;
  std::string machine_label;
  int64_t preallocate_series;
  std::string preallocate_metric;
  int64_t partition_timeout_ms;  // Per partition in debug_state().
  bool serve_partitions;         // Start a listener for every partition.

  ControlOptions()
      : machines_per_partition(200),
        metric_label(label::METRIC_NAME),
        machine_label("machineid"),
        preallocate_series(0),
        preallocate_metric("fake_machine_metric"),
        partition_timeout_ms(1000),
        serve_partitions(true) {}
};

class PartitionPlan {
 public:
  int partitions;
  int created;
  int64_t machines_per_partition;
  std::vector<int> ports;

  PartitionPlan() : partitions(0), created(0), machines_per_partition(0) {}
};

// PartitionReport is one section of the debug view. An unreachable
// partition is reported with reachable = false and the failure in error.
class PartitionReport {
 public:
  routing::Assignment assignment;
  bool reachable;
  std::string error;
  PartitionSummary summary;

  PartitionReport() : reachable(false) {}
};

class DebugState {
 public:
  int64_t timestamp;
  int64_t machines_per_partition;
  std::vector<PartitionReport> partitions;

  DebugState() : timestamp(0), machines_per_partition(0) {}
};

// ControlPlane turns capacity hints into partitions. Registration only ever
// extends the table, so repeating a hint is a no-op.
class ControlPlane : boost::noncopyable {
 private:
  routing::PartitionTable* table_;
  ingest::IngestRouter* router_;
  db::Metrics* metrics_;
  ControlOptions opts_;

  base::MutexLock servers_mutex_;
  std::vector<std::unique_ptr<partition::PartitionServer>> servers_;

  std::pair<std::shared_ptr<partition::Partition>, error::Error> provision(
      const routing::Assignment& a);
  PartitionReport fetch_report(const routing::Assignment& a);

 public:
  ControlPlane(routing::PartitionTable* table, ingest::IngestRouter* router,
               const ControlOptions& opts, db::Metrics* metrics = nullptr);
  ~ControlPlane();

  // required_partitions is ceil(capacity_hint / machines_per_partition).
  static int required_partitions(int64_t capacity_hint,
                                 int64_t machines_per_partition);

  // validate rejects a registration without touching the table.
  // machines_per_partition <= 0 selects the configured default.
  error::Error validate(int64_t capacity_hint,
                        int64_t machines_per_partition);

  // register_config ensures ceil(capacity_hint / machines_per_partition)
  // partitions exist and listen before returning.
  std::pair<PartitionPlan, error::Error> register_config(
      int64_t capacity_hint, int64_t machines_per_partition);

  PartitionPlan plan();

  // debug_state never fails; unreachable partitions become degraded
  // sections.
  DebugState debug_state();

  void stop();
};

}  // namespace control
}  // namespace sketchdb

#endif
