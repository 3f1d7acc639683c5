#include "routing/RoutingTable.hpp"

#include "label/Label.hpp"

namespace sketchdb {
namespace routing {

std::pair<Assignment, bool> RoutingTable::route(int64_t machine_idx) {
  Assignment a;
  bool ok = table_->find(machine_idx, &a);
  return {a, ok};
}

std::pair<Assignment, bool> RoutingTable::route(const std::string& machine) {
  std::pair<int64_t, bool> idx = label::parse_machine_index(machine);
  if (!idx.second) return {Assignment(), false};
  return route(idx.first);
}

}  // namespace routing
}  // namespace sketchdb
