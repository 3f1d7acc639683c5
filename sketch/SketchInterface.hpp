#ifndef SKETCHINTERFACE_H
#define SKETCHINTERFACE_H

#include <stdint.h>

#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "base/Error.hpp"
#include "sketch/SketchFunctions.hpp"

namespace sketchdb {
namespace sketch {

class Sample {
 public:
  int64_t t;
  double v;

  Sample() : t(std::numeric_limits<int64_t>::min()), v(0) {}
  Sample(int64_t t, double v) : t(t), v(v) {}
};

typedef std::vector<Sample> Vector;
typedef std::map<std::string, std::string> Annotations;

// SketchOptions is fixed when a sketch is created.
struct SketchOptions {
  int64_t time_window;  // ms of history kept behind the newest sample.
  int64_t item_window;  // max samples summarized at once.
  double value_scale;   // expected magnitude of values.

  SketchOptions()
      : time_window(60 * 1000), item_window(100000), value_scale(10000) {}
  SketchOptions(int64_t time_window, int64_t item_window, double value_scale)
      : time_window(time_window),
        item_window(item_window),
        value_scale(value_scale) {}
};

// SketchInterface is the boundary to the summary algorithms. Implementations
// are not thread safe; the owner serializes access.
class SketchInterface {
 public:
  virtual ~SketchInterface() = default;

  // Timestamps must be non-decreasing.
  virtual error::Error insert(int64_t t, double v) = 0;

  // covered returns whether [mint, maxt] lies within the retained history.
  virtual bool covered(int64_t mint, int64_t maxt) const = 0;

  // eval computes fn over [mint, maxt]. now is the wall clock in ms for
  // implementations whose state decays with time.
  virtual Vector eval(const FunctionDesc* fn, double arg, int64_t mint,
                      int64_t maxt, int64_t now,
                      Annotations* annotations) const = 0;

  virtual SketchKind kind() const = 0;

  // Number of samples currently summarized.
  virtual uint64_t retained() const = 0;
};

std::unique_ptr<SketchInterface> new_sketch(SketchKind kind,
                                            const SketchOptions& opts);

}  // namespace sketch
}  // namespace sketchdb

#endif
