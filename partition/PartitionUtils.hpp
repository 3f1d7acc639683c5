#pragma once

#include <string>

#include "base/Error.hpp"

namespace sketchdb {
namespace partition {

// ErrOutOfOrderSample is returned if an inserted sample has a timestamp
// smaller than the most recent sample of its sketch instance.
extern const error::Error ErrOutOfOrderSample;

// ErrInvalidValue is returned for NaN and infinite values.
extern const error::Error ErrInvalidValue;

// ErrMissingMetricName is returned if a sample carries no metric name.
extern const error::Error ErrMissingMetricName;

// ErrMissingMachine is returned if the machine label is absent or its value
// has no numeric index.
extern const error::Error ErrMissingMachine;

// ErrMachineOutOfRange is returned if a sample belongs to a machine owned by
// another partition.
extern const error::Error ErrMachineOutOfRange;

extern const int STRIPE_SIZE;
extern const uint64_t STRIPE_MASK;

enum Coverage {
  UNCOVERED,
  PARTIAL,
  COVERED,
};

const char* coverage_name(Coverage c);

}  // namespace partition
}  // namespace sketchdb
