#include "sketch/SketchFunctions.hpp"

#include <cmath>
#include <sstream>

namespace sketchdb {
namespace sketch {

namespace {

const FunctionDesc kFunctions[] = {
    {"avg_over_time", FN_AVG, KIND_MOMENTS, false, 0, 0},
    {"count_over_time", FN_COUNT, KIND_MOMENTS, false, 0, 0},
    {"sum_over_time", FN_SUM, KIND_MOMENTS, false, 0, 0},
    {"sum2_over_time", FN_SUM2, KIND_MOMENTS, false, 0, 0},
    {"min_over_time", FN_MIN, KIND_MOMENTS, false, 0, 0},
    {"max_over_time", FN_MAX, KIND_MOMENTS, false, 0, 0},
    {"stddev_over_time", FN_STDDEV, KIND_MOMENTS, false, 0, 0},
    {"stdvar_over_time", FN_STDVAR, KIND_MOMENTS, false, 0, 0},
    {"quantile_over_time", FN_QUANTILE, KIND_QUANTILE, true, 0, 1},
    {"entropy_over_time", FN_ENTROPY, KIND_FREQUENCY, false, 0, 0},
    {"distinct_over_time", FN_DISTINCT, KIND_FREQUENCY, false, 0, 0},
    {"l1_over_time", FN_L1, KIND_FREQUENCY, false, 0, 0},
    {"l2_over_time", FN_L2, KIND_FREQUENCY, false, 0, 0},
};

const size_t kNumFunctions = sizeof(kFunctions) / sizeof(kFunctions[0]);

}  // namespace

const FunctionDesc* lookup_function(const std::string& name) {
  for (size_t i = 0; i < kNumFunctions; i++) {
    if (name == kFunctions[i].name) return &kFunctions[i];
  }
  return nullptr;
}

std::vector<std::string> function_names() {
  std::vector<std::string> names;
  names.reserve(kNumFunctions);
  for (size_t i = 0; i < kNumFunctions; i++)
    names.push_back(kFunctions[i].name);
  return names;
}

const char* kind_name(SketchKind kind) {
  switch (kind) {
    case KIND_MOMENTS:
      return "moments";
    case KIND_QUANTILE:
      return "quantile";
    case KIND_FREQUENCY:
      return "frequency";
  }
  return "unknown";
}

error::Error validate_argument(const FunctionDesc* desc, bool has_arg,
                               double arg) {
  if (!desc->needs_arg) return error::Error();
  if (!has_arg)
    return error::Error(std::string(desc->name) + " requires a numeric argument");
  if (std::isnan(arg) || arg < desc->arg_min || arg > desc->arg_max) {
    std::ostringstream os;
    os << desc->name << " argument " << arg << " out of range ["
       << desc->arg_min << ", " << desc->arg_max << "]";
    return error::Error(os.str());
  }
  return error::Error();
}

const FunctionDesc* resolve_function(
    const std::vector<const FunctionDesc*>& enabled, const FunctionDesc* fn) {
  for (const FunctionDesc* e : enabled) {
    if (e == fn) return e;
  }
  for (const FunctionDesc* e : enabled) {
    if (e->kind == fn->kind) return e;
  }
  return nullptr;
}

}  // namespace sketch

}  // namespace sketchdb
