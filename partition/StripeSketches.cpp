#include "partition/StripeSketches.hpp"

namespace sketchdb {
namespace partition {

StripeSketches::StripeSketches() : hashes_(STRIPE_SIZE), locks_(STRIPE_SIZE) {}

uint64_t StripeSketches::hash(const label::Labels& lset,
                              const sketch::FunctionDesc* fn) {
  uint64_t h = label::lbs_hash(lset);
  for (const char* c = fn->name; *c; ++c) {
    h ^= static_cast<unsigned char>(*c);
    h *= 1099511628211ull;
  }
  return h;
}

std::shared_ptr<SketchInstance> StripeSketches::get(
    const label::Labels& lset, const sketch::FunctionDesc* fn) {
  uint64_t h = hash(lset, fn);
  uint64_t i = h & STRIPE_MASK;
  base::RWLockGuard lock(locks_[i], 0);
  return hashes_[i].get(h, lset, fn);
}

std::pair<std::shared_ptr<SketchInstance>, bool> StripeSketches::get_or_create(
    const label::Labels& lset, const sketch::FunctionDesc* fn,
    const sketch::SketchOptions& opts) {
  uint64_t h = hash(lset, fn);
  uint64_t i = h & STRIPE_MASK;
  {
    base::RWLockGuard lock(locks_[i], 0);
    std::shared_ptr<SketchInstance> s = hashes_[i].get(h, lset, fn);
    if (s) return {s, false};
  }
  base::RWLockGuard lock(locks_[i], 1);
  std::shared_ptr<SketchInstance> s = hashes_[i].get(h, lset, fn);
  if (s) return {s, false};
  s = std::make_shared<SketchInstance>(lset, fn, opts);
  hashes_[i].set(h, s);
  return {s, true};
}

void StripeSketches::iter(
    const std::function<void(const std::shared_ptr<SketchInstance>&)>& fn) {
  for (int i = 0; i < STRIPE_SIZE; i++) {
    base::RWLockGuard lock(locks_[i], 0);
    for (const auto& p : hashes_[i].map) {
      for (const auto& s : p.second) fn(s);
    }
  }
}

size_t StripeSketches::size() {
  size_t n = 0;
  for (int i = 0; i < STRIPE_SIZE; i++) {
    base::RWLockGuard lock(locks_[i], 0);
    for (const auto& p : hashes_[i].map) n += p.second.size();
  }
  return n;
}

}  // namespace partition
}  // namespace sketchdb
