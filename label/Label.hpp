#ifndef LABEL_H
#define LABEL_H

#include <stdint.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace sketchdb {
namespace label {

extern const std::string METRIC_NAME;  // "__name__"

class Label {
 public:
  std::string label;
  std::string value;

  Label() = default;
  Label(const std::string& label, const std::string& value)
      : label(label), value(value) {}

  bool operator==(const Label& l) const {
    return label == l.label && value == l.value;
  }
  bool operator!=(const Label& l) const { return !(*this == l); }
  bool operator<(const Label& l) const {
    if (label != l.label) return label < l.label;
    return value < l.value;
  }
};

// Labels is kept sorted by name with unique names. Every function below that
// builds a Labels preserves that.
typedef std::vector<Label> Labels;

// Sorts by name and drops earlier duplicates of a name (last write wins).
void lbs_normalize(Labels* lset);

Labels lbs_from_map(const std::map<std::string, std::string>& m);

int lbs_compare(const Labels& l1, const Labels& l2);

// Returns the value of name, or "" if absent.
std::string lbs_get(const Labels& lset, const std::string& name);
bool lbs_has(const Labels& lset, const std::string& name);

std::string lbs_string(const Labels& lset);

uint64_t lbs_hash(const Labels& lset);

// Returns <index, true> for a machine id whose suffix after the last '_' (or
// the whole value when there is none) is a decimal number, e.g.
// "machine_17" -> 17.
std::pair<int64_t, bool> parse_machine_index(const std::string& machine);

// Builder accumulates label updates on top of a base set.
class Builder {
 private:
  std::map<std::string, std::string> m_;

 public:
  Builder() = default;
  explicit Builder(const Labels& base);

  Builder& set(const std::string& name, const std::string& value);

  Labels labels() const;
};

}  // namespace label
}  // namespace sketchdb

#endif
