#ifndef STRIPESKETCHES_H
#define STRIPESKETCHES_H

#include <functional>
#include <vector>

#include "base/Mutex.hpp"
#include "partition/SketchHashmap.hpp"

namespace sketchdb {
namespace partition {

// StripeSketches locks modulo ranges of hashes to reduce lock contention
// between inserts of different keys. The locks are padded to not be on the
// same cache line.
class StripeSketches {
 private:
  std::vector<SketchHashmap> hashes_;
  std::vector<base::PadRWMutexLock> locks_;

 public:
  StripeSketches();

  static uint64_t hash(const label::Labels& lset,
                       const sketch::FunctionDesc* fn);

  std::shared_ptr<SketchInstance> get(const label::Labels& lset,
                                      const sketch::FunctionDesc* fn);

  // Return <SketchInstance, if the instance being created>.
  std::pair<std::shared_ptr<SketchInstance>, bool> get_or_create(
      const label::Labels& lset, const sketch::FunctionDesc* fn,
      const sketch::SketchOptions& opts);

  void iter(const std::function<void(const std::shared_ptr<SketchInstance>&)>&
                fn);

  size_t size();
};

}  // namespace partition
}  // namespace sketchdb

#endif
