#include "routing/PartitionTable.hpp"

#include "base/Logging.hpp"
#include "routing/RoutingTable.hpp"

namespace sketchdb {
namespace routing {

PartitionTable::PartitionTable(const TableOptions& opts)
    : opts_(opts), machines_per_partition_(0) {}

error::Error PartitionTable::validate_port(int port) const {
  if (port <= 0 || port > 65535)
    return error::Error("port " + std::to_string(port) + " out of range");
  if (port == opts_.control_port)
    return error::Error("port " + std::to_string(port) +
                        " is the control port");
  if (opts_.port_blocklist.count(port) > 0)
    return error::Error("port " + std::to_string(port) + " is blocked");
  return error::Error();
}

error::Error PartitionTable::validate_plan(int64_t machines_per_partition,
                                           int count) const {
  if (machines_per_partition <= 0)
    return error::Error("machines per partition must be positive");
  if (count > opts_.max_partitions)
    return error::Error(std::to_string(count) + " partitions exceed the limit " +
                        std::to_string(opts_.max_partitions));
  for (int i = 0; i < count; i++) {
    error::Error err = validate_port(opts_.base_port + i);
    if (err) return error::wrap(err, "partition " + std::to_string(i));
  }
  return error::Error();
}

std::pair<int, error::Error> PartitionTable::extend(
    int required, int64_t machines_per_partition,
    const ProvisionFunc& provision) {
  base::MutexLockGuard provision_lock(provision_mutex_);
  int current;
  {
    base::RWLockGuard lock(mutex_, 0);
    if (!assignments_.empty() &&
        machines_per_partition != machines_per_partition_)
      return {0, error::Error("machines per partition is fixed at " +
                              std::to_string(machines_per_partition_))};
    current = static_cast<int>(assignments_.size());
  }
  if (required <= current) return {0, error::Error()};

  error::Error err = validate_plan(machines_per_partition, required);
  if (err) return {0, err};

  int created = 0;
  for (int i = current; i < required; i++) {
    Assignment a;
    a.index = i;
    a.machine_begin = static_cast<int64_t>(i) * machines_per_partition;
    a.machine_end = a.machine_begin + machines_per_partition;
    a.host = opts_.host;
    a.port = opts_.base_port + i;

    std::pair<std::shared_ptr<partition::Partition>, error::Error> p =
        provision(a);
    if (p.second)
      return {created,
              error::wrap(p.second, "provision partition " + std::to_string(i))};
    a.partition = p.first;
    {
      base::RWLockGuard lock(mutex_, 1);
      assignments_.push_back(a);
      machines_per_partition_ = machines_per_partition;
    }
    ++created;
    LOG_INFO << "partition " << i << " machines [" << a.machine_begin << ", "
             << a.machine_end << ") at " << a.host << ":" << a.port;
  }
  return {created, error::Error()};
}

bool PartitionTable::find(int64_t machine_idx, Assignment* a) {
  base::RWLockGuard lock(mutex_, 0);
  if (machines_per_partition_ <= 0 || machine_idx < 0) return false;
  int64_t i = RoutingTable::partition_of(machine_idx, machines_per_partition_);
  if (i >= static_cast<int64_t>(assignments_.size())) return false;
  *a = assignments_[i];
  return true;
}

std::vector<Assignment> PartitionTable::assignments() {
  base::RWLockGuard lock(mutex_, 0);
  return assignments_;
}

int PartitionTable::size() {
  base::RWLockGuard lock(mutex_, 0);
  return static_cast<int>(assignments_.size());
}

int64_t PartitionTable::machines_per_partition() {
  base::RWLockGuard lock(mutex_, 0);
  return machines_per_partition_;
}

}  // namespace routing
}  // namespace sketchdb
