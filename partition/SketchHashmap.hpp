#pragma once

#include <list>
#include <memory>
#include <unordered_map>

#include "partition/SketchInstance.hpp"

namespace sketchdb {
namespace partition {

// SketchHashmap maps a (label set, function) hash to its instances and keeps
// a list per hash to resolve collisions. The hash is passed in by the caller
// to avoid recomputing it.
class SketchHashmap {
 public:
  std::unordered_map<uint64_t, std::list<std::shared_ptr<SketchInstance>>> map;

 public:
  SketchHashmap() = default;

  std::shared_ptr<SketchInstance> get(uint64_t hash, const label::Labels& lset,
                                      const sketch::FunctionDesc* fn) const;
  void set(uint64_t hash, const std::shared_ptr<SketchInstance>& s);
};

}  // namespace partition
}  // namespace sketchdb
