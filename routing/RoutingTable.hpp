#pragma once

#include "routing/PartitionTable.hpp"

namespace sketchdb {
namespace routing {

// RoutingTable answers which partition owns a machine under the current plan.
// Ranges are index / machines_per_partition, so growing the plan never moves
// a machine that is already assigned.
class RoutingTable {
 private:
  PartitionTable* table_;

 public:
  explicit RoutingTable(PartitionTable* table) : table_(table) {}

  static int64_t partition_of(int64_t machine_idx,
                              int64_t machines_per_partition) {
    return machine_idx / machines_per_partition;
  }

  // Return <assignment, if the machine is routable>.
  std::pair<Assignment, bool> route(int64_t machine_idx);
  std::pair<Assignment, bool> route(const std::string& machine);

  PartitionTable* table() { return table_; }
};

}  // namespace routing
}  // namespace sketchdb
