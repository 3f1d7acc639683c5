#include "label/Label.hpp"

#include <algorithm>

namespace sketchdb {
namespace label {

const std::string METRIC_NAME = "__name__";

void lbs_normalize(Labels* lset) {
  // Stable sort keeps arrival order among equal names so the last one wins.
  std::stable_sort(lset->begin(), lset->end(),
                   [](const Label& l, const Label& r) {
                     return l.label < r.label;
                   });
  Labels out;
  out.reserve(lset->size());
  for (auto& l : *lset) {
    if (!out.empty() && out.back().label == l.label)
      out.back().value = std::move(l.value);
    else
      out.push_back(std::move(l));
  }
  lset->swap(out);
}

Labels lbs_from_map(const std::map<std::string, std::string>& m) {
  Labels lset;
  lset.reserve(m.size());
  for (const auto& p : m) lset.emplace_back(p.first, p.second);
  return lset;
}

int lbs_compare(const Labels& l1, const Labels& l2) {
  size_t n = std::min(l1.size(), l2.size());
  for (size_t i = 0; i < n; i++) {
    int c = l1[i].label.compare(l2[i].label);
    if (c != 0) return c;
    c = l1[i].value.compare(l2[i].value);
    if (c != 0) return c;
  }
  if (l1.size() == l2.size()) return 0;
  return l1.size() < l2.size() ? -1 : 1;
}

std::string lbs_get(const Labels& lset, const std::string& name) {
  auto it = std::lower_bound(
      lset.begin(), lset.end(), name,
      [](const Label& l, const std::string& n) { return l.label < n; });
  if (it != lset.end() && it->label == name) return it->value;
  return "";
}

bool lbs_has(const Labels& lset, const std::string& name) {
  auto it = std::lower_bound(
      lset.begin(), lset.end(), name,
      [](const Label& l, const std::string& n) { return l.label < n; });
  return it != lset.end() && it->label == name;
}

std::string lbs_string(const Labels& lset) {
  std::string s("{");
  for (size_t i = 0; i < lset.size(); i++) {
    if (i > 0) s.append(", ");
    s.append(lset[i].label);
    s.append("=\"");
    s.append(lset[i].value);
    s.append("\"");
  }
  s.append("}");
  return s;
}

// FNV-1a over name/value pairs with 0xff separators, which never occur in
// valid UTF-8.
uint64_t lbs_hash(const Labels& lset) {
  uint64_t h = 14695981039346656037ull;
  auto mix = [&h](const std::string& s) {
    for (unsigned char c : s) {
      h ^= c;
      h *= 1099511628211ull;
    }
    h ^= 0xff;
    h *= 1099511628211ull;
  };
  for (const auto& l : lset) {
    mix(l.label);
    mix(l.value);
  }
  return h;
}

std::pair<int64_t, bool> parse_machine_index(const std::string& machine) {
  size_t pos = machine.rfind('_');
  size_t begin = pos == std::string::npos ? 0 : pos + 1;
  if (begin >= machine.size() || machine.size() - begin > 18)
    return {0, false};
  int64_t idx = 0;
  for (size_t i = begin; i < machine.size(); i++) {
    if (machine[i] < '0' || machine[i] > '9') return {0, false};
    idx = idx * 10 + (machine[i] - '0');
  }
  return {idx, true};
}

Builder::Builder(const Labels& base) {
  for (const auto& l : base) m_[l.label] = l.value;
}

Builder& Builder::set(const std::string& name, const std::string& value) {
  if (value.empty())
    m_.erase(name);
  else
    m_[name] = value;
  return *this;
}

Labels Builder::labels() const { return lbs_from_map(m_); }

}  // namespace label
}  // namespace sketchdb
