#include "db/Metrics.hpp"

#include <prometheus/text_serializer.h>

#include <sstream>

namespace sketchdb {
namespace db {

namespace {

prometheus::Family<prometheus::Counter>& counter_family(
    prometheus::Registry& registry, const std::string& name,
    const std::string& help) {
  return prometheus::BuildCounter().Name(name).Help(help).Register(registry);
}

prometheus::Family<prometheus::Gauge>& gauge_family(
    prometheus::Registry& registry, const std::string& name,
    const std::string& help) {
  return prometheus::BuildGauge().Name(name).Help(help).Register(registry);
}

}  // namespace

Metrics::Metrics()
    : registry_(std::make_shared<prometheus::Registry>()),
      ingested_(counter_family(*registry_, "sketchdb_total_ingested",
                               "Samples inserted into every configured sketch")
                    .Add({})),
      failed_(counter_family(*registry_, "sketchdb_ingest_failed_total",
                             "Samples skipped by ingestion")
                  .Add({})),
      queries_(counter_family(*registry_, "sketchdb_queries_total",
                              "Queries by outcome")),
      partitions_(gauge_family(*registry_, "sketchdb_partitions_active",
                               "Provisioned partitions")
                      .Add({})),
      inflight_(gauge_family(*registry_, "sketchdb_ingest_inflight",
                             "Partition batches being inserted")
                    .Add({})) {}

void Metrics::add_ingested(int ok, int failed) {
  if (ok > 0) ingested_.Increment(ok);
  if (failed > 0) failed_.Increment(failed);
}

void Metrics::inc_query(const std::string& status) {
  queries_.Add({{"status", status}}).Increment();
}

void Metrics::set_partitions(int n) { partitions_.Set(n); }

std::string Metrics::serialize() const {
  std::ostringstream os;
  prometheus::TextSerializer serializer;
  serializer.Serialize(os, registry_->Collect());
  return os.str();
}

}  // namespace db
}  // namespace sketchdb
