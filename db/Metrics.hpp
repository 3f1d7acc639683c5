#pragma once

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include <boost/noncopyable.hpp>
#include <memory>
#include <string>

namespace sketchdb {
namespace db {

// Metrics holds the process counters served on /metrics. Updating them never
// touches partition state.
class Metrics : boost::noncopyable {
 private:
  std::shared_ptr<prometheus::Registry> registry_;
  prometheus::Counter& ingested_;
  prometheus::Counter& failed_;
  prometheus::Family<prometheus::Counter>& queries_;
  prometheus::Gauge& partitions_;
  prometheus::Gauge& inflight_;

 public:
  Metrics();

  void add_ingested(int ok, int failed);
  void inc_query(const std::string& status);
  void set_partitions(int n);
  void inc_inflight() { inflight_.Increment(); }
  void dec_inflight() { inflight_.Decrement(); }

  double total_ingested() const { return ingested_.Value(); }
  double total_failed() const { return failed_.Value(); }

  // Prometheus text exposition format.
  std::string serialize() const;
};

}  // namespace db
}  // namespace sketchdb
