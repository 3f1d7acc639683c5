#include "partition/PartitionUtils.hpp"

namespace sketchdb {
namespace partition {

const error::Error ErrOutOfOrderSample("out of order sample");
const error::Error ErrInvalidValue("invalid sample value");
const error::Error ErrMissingMetricName("missing metric name");
const error::Error ErrMissingMachine("missing or unparsable machine id");
const error::Error ErrMachineOutOfRange("machine outside partition range");

const int STRIPE_SIZE = 1 << 8;
const uint64_t STRIPE_MASK = STRIPE_SIZE - 1;

const char* coverage_name(Coverage c) {
  switch (c) {
    case UNCOVERED:
      return "uncovered";
    case PARTIAL:
      return "partial";
    case COVERED:
      return "covered";
  }
  return "unknown";
}

}  // namespace partition
}  // namespace sketchdb
