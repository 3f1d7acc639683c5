#include "control/ControlPlane.hpp"

#include <snappy.h>

#include "base/Logging.hpp"
#include "base/TimeStamp.hpp"
#include "db/Metrics.hpp"

namespace sketchdb {
namespace control {

ControlPlane::ControlPlane(routing::PartitionTable* table,
                           ingest::IngestRouter* router,
                           const ControlOptions& opts, db::Metrics* metrics)
    : table_(table), router_(router), metrics_(metrics), opts_(opts) {}

ControlPlane::~ControlPlane() { stop(); }

int ControlPlane::required_partitions(int64_t capacity_hint,
                                      int64_t machines_per_partition) {
  if (capacity_hint <= 0 || machines_per_partition <= 0) return 0;
  return static_cast<int>((capacity_hint + machines_per_partition - 1) /
                          machines_per_partition);
}

error::Error ControlPlane::validate(int64_t capacity_hint,
                                   int64_t machines_per_partition) {
  if (machines_per_partition <= 0)
    machines_per_partition = opts_.machines_per_partition;
  if (capacity_hint <= 0)
    return error::Error("estimated_timeseries must be positive");
  int64_t fixed = table_->machines_per_partition();
  if (fixed > 0 && fixed != machines_per_partition)
    return error::Error("machines_per_port is fixed at " +
                        std::to_string(fixed));
  int64_t required = (capacity_hint + machines_per_partition - 1) /
                     machines_per_partition;
  if (required > table_->options().max_partitions)
    return error::Error(std::to_string(required) +
                        " partitions exceed the limit " +
                        std::to_string(table_->options().max_partitions));
  return table_->validate_plan(machines_per_partition,
                               static_cast<int>(required));
}

std::pair<std::shared_ptr<partition::Partition>, error::Error>
ControlPlane::provision(const routing::Assignment& a) {
  partition::PartitionOptions po;
  po.index = a.index;
  po.host = a.host;
  po.port = a.port;
  po.machine_begin = a.machine_begin;
  po.machine_end = a.machine_end;
  po.functions = opts_.functions;
  po.sketch_options = opts_.sketch_options;
  po.metric_label = opts_.metric_label;
  po.machine_label = opts_.machine_label;
  std::shared_ptr<partition::Partition> p =
      std::make_shared<partition::Partition>(po);

  if (opts_.preallocate_series > 0)
    p->preallocate(opts_.preallocate_series, opts_.preallocate_metric);

  if (opts_.serve_partitions) {
    std::unique_ptr<partition::PartitionServer> server(
        new partition::PartitionServer(p, router_));
    error::Error err = server->start();
    if (err) return {nullptr, err};
    base::MutexLockGuard lock(servers_mutex_);
    servers_.push_back(std::move(server));
  }
  return {p, error::Error()};
}

std::pair<PartitionPlan, error::Error> ControlPlane::register_config(
    int64_t capacity_hint, int64_t machines_per_partition) {
  if (machines_per_partition <= 0)
    machines_per_partition = opts_.machines_per_partition;
  error::Error err = validate(capacity_hint, machines_per_partition);
  if (err) return {PartitionPlan(), err};

  int required = required_partitions(capacity_hint, machines_per_partition);
  std::pair<int, error::Error> p = table_->extend(
      required, machines_per_partition,
      [this](const routing::Assignment& a) { return this->provision(a); });
  if (metrics_) metrics_->set_partitions(table_->size());

  PartitionPlan plan = this->plan();
  plan.created = p.first;
  if (p.second) {
    LOG_ERROR << "register_config(" << capacity_hint << ", "
              << machines_per_partition << "): " << p.second.error();
    return {plan, p.second};
  }
  LOG_INFO << "register_config(" << capacity_hint << ", "
           << machines_per_partition << "): " << plan.partitions
           << " partition(s), " << p.first << " new";
  return {plan, error::Error()};
}

PartitionPlan ControlPlane::plan() {
  PartitionPlan plan;
  std::vector<routing::Assignment> assignments = table_->assignments();
  plan.partitions = static_cast<int>(assignments.size());
  plan.machines_per_partition = table_->machines_per_partition();
  for (const routing::Assignment& a : assignments) plan.ports.push_back(a.port);
  return plan;
}

PartitionReport ControlPlane::fetch_report(const routing::Assignment& a) {
  PartitionReport r;
  r.assignment = a;
  if (!opts_.serve_partitions) {
    a.partition->summary(&r.summary);
    r.reachable = true;
    return r;
  }

  httplib::Client cli(a.host, a.port);
  int64_t timeout = opts_.partition_timeout_ms;
  cli.set_connection_timeout(timeout / 1000, (timeout % 1000) * 1000);
  cli.set_read_timeout(timeout / 1000, (timeout % 1000) * 1000);
  auto res = cli.Get("/debug-summary");
  if (!res) {
    r.error = "partition " + std::to_string(a.index) + " unreachable at " +
              a.host + ":" + std::to_string(a.port);
    return r;
  }
  if (res->status != 200) {
    r.error = "partition " + std::to_string(a.index) + " returned " +
              std::to_string(res->status);
    return r;
  }
  std::string data;
  if (!snappy::Uncompress(res->body.data(), res->body.size(), &data) ||
      !r.summary.ParseFromString(data)) {
    r.error = "partition " + std::to_string(a.index) + " sent a bad summary";
    return r;
  }
  r.reachable = true;
  return r;
}

DebugState ControlPlane::debug_state() {
  DebugState state;
  state.timestamp = base::now_millis();
  state.machines_per_partition = table_->machines_per_partition();
  for (const routing::Assignment& a : table_->assignments()) {
    state.partitions.push_back(fetch_report(a));
    if (!state.partitions.back().reachable)
      LOG_WARN << "debug_state: " << state.partitions.back().error;
  }
  return state;
}

void ControlPlane::stop() {
  base::MutexLockGuard lock(servers_mutex_);
  for (auto& s : servers_) s->stop();
}

}  // namespace control
}  // namespace sketchdb
