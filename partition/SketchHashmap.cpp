#include "partition/SketchHashmap.hpp"

#include <algorithm>

namespace sketchdb {
namespace partition {

std::shared_ptr<SketchInstance> SketchHashmap::get(
    uint64_t hash, const label::Labels& lset,
    const sketch::FunctionDesc* fn) const {
  auto it1 = map.find(hash);
  if (it1 == map.end()) return nullptr;
  auto it2 = std::find_if(it1->second.begin(), it1->second.end(),
                          [&lset, fn](const std::shared_ptr<SketchInstance>& s) {
                            return s->fn == fn &&
                                   label::lbs_compare(s->labels, lset) == 0;
                          });
  if (it2 == it1->second.end()) return nullptr;
  return *it2;
}

void SketchHashmap::set(uint64_t hash, const std::shared_ptr<SketchInstance>& s) {
  auto it1 = map.find(hash);
  if (it1 == map.end()) {
    map.insert({hash, {s}});
    return;
  }
  auto it2 = std::find_if(it1->second.begin(), it1->second.end(),
                          [&s](const std::shared_ptr<SketchInstance>& s1) {
                            return s->fn == s1->fn &&
                                   label::lbs_compare(s->labels, s1->labels) == 0;
                          });
  if (it2 == it1->second.end())
    it1->second.push_back(s);
  else
    *it2 = s;
}

}  // namespace partition
}  // namespace sketchdb
