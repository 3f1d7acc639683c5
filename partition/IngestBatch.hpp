#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "base/Error.hpp"
#include "label/Label.hpp"

namespace sketchdb {
namespace partition {

class MetricSample {
 public:
  std::string name;
  label::Labels labels;
  double value;
  error::Error err;  // Set when the entry could not be decoded.

  MetricSample() : value(0) {}
  MetricSample(const std::string& name, const label::Labels& labels,
               double value)
      : name(name), labels(labels), value(value) {}
};

// IngestBatch carries one timestamp for all of its metrics.
class IngestBatch {
 public:
  int64_t timestamp;
  std::vector<MetricSample> metrics;

  IngestBatch() : timestamp(0) {}
  explicit IngestBatch(int64_t timestamp) : timestamp(timestamp) {}
};

}  // namespace partition
}  // namespace sketchdb
