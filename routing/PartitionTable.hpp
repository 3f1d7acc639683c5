#ifndef PARTITIONTABLE_H
#define PARTITIONTABLE_H

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "base/Error.hpp"
#include "base/Mutex.hpp"

namespace sketchdb {
namespace partition {
class Partition;
}

namespace routing {

class TableOptions {
 public:
  std::string host;
  int control_port;
  int base_port;
  int max_partitions;
  std::set<int> port_blocklist;

  TableOptions()
      : host("127.0.0.1"),
        control_port(7000),
        base_port(7100),
        max_partitions(64) {}
};

// Assignment maps machines [machine_begin, machine_end) to a listening
// address.
class Assignment {
 public:
  int index;
  int64_t machine_begin;
  int64_t machine_end;
  std::string host;
  int port;
  std::shared_ptr<partition::Partition> partition;

  Assignment() : index(-1), machine_begin(0), machine_end(0), port(0) {}
};

// PartitionTable is the single source of the partition plan. It only grows:
// assignments are appended by extend() and never moved or removed.
class PartitionTable : boost::noncopyable {
 public:
  // Called for every new assignment before it becomes routable.
  typedef std::function<std::pair<std::shared_ptr<partition::Partition>,
                                  error::Error>(const Assignment&)>
      ProvisionFunc;

  explicit PartitionTable(const TableOptions& opts);

  const TableOptions& options() const { return opts_; }

  // validate_port returns an error if port may never carry data.
  error::Error validate_port(int port) const;

  // validate_plan checks a plan of count partitions holding
  // machines_per_partition machines each.
  error::Error validate_plan(int64_t machines_per_partition, int count) const;

  // extend grows the table to required partitions. Callers are serialized
  // on the provisioning mutex, so concurrent callers never provision the same
  // partition twice. Provisioning runs outside the table lock; each finished
  // assignment is appended under the writer lock. Return
  // <partitions created, error>.
  std::pair<int, error::Error> extend(int required,
                                      int64_t machines_per_partition,
                                      const ProvisionFunc& provision);

  // find returns the assignment owning machine_idx.
  bool find(int64_t machine_idx, Assignment* a);

  std::vector<Assignment> assignments();
  int size();
  int64_t machines_per_partition();

 private:
  base::MutexLock provision_mutex_;
  base::RWMutexLock mutex_;
  TableOptions opts_;
  int64_t machines_per_partition_;  // 0 until the first partition exists.
  std::vector<Assignment> assignments_;
};

}  // namespace routing
}  // namespace sketchdb

#endif
