#pragma once

#include <string>
#include <vector>

#include "base/Error.hpp"

namespace sketchdb {
namespace sketch {

// SketchKind names the summary a function is answered from. Functions of the
// same kind can be answered by one sketch instance.
enum SketchKind {
  KIND_MOMENTS = 0,
  KIND_QUANTILE = 1,
  KIND_FREQUENCY = 2,
};

enum FunctionType {
  FN_AVG,
  FN_COUNT,
  FN_SUM,
  FN_SUM2,
  FN_MIN,
  FN_MAX,
  FN_STDDEV,
  FN_STDVAR,
  FN_QUANTILE,
  FN_ENTROPY,
  FN_DISTINCT,
  FN_L1,
  FN_L2,
};

struct FunctionDesc {
  const char* name;
  FunctionType type;
  SketchKind kind;
  bool needs_arg;
  double arg_min;
  double arg_max;
};

// Returns nullptr for unknown names.
const FunctionDesc* lookup_function(const std::string& name);

std::vector<std::string> function_names();

const char* kind_name(SketchKind kind);

// validate_argument checks the numeric argument against the function's
// constraints, e.g. quantile_over_time needs a rank in [0, 1].
error::Error validate_argument(const FunctionDesc* desc, bool has_arg,
                               double arg);

// resolve_function returns the enabled function whose instances answer fn:
// fn itself when enabled, otherwise the first enabled function of the same
// kind. nullptr if there is none.
const FunctionDesc* resolve_function(
    const std::vector<const FunctionDesc*>& enabled, const FunctionDesc* fn);

}  // namespace sketch
}  // namespace sketchdb
