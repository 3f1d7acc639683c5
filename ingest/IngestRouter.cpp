#include "ingest/IngestRouter.hpp"

#include <map>

#include "base/Logging.hpp"
#include "base/WaitGroup.hpp"
#include "db/Metrics.hpp"

namespace sketchdb {
namespace ingest {

namespace {

// Counts a partition batch in flight for the guard's lifetime.
class InflightGuard : boost::noncopyable {
 private:
  std::atomic<int>* inflight_;
  db::Metrics* metrics_;

 public:
  InflightGuard(std::atomic<int>* inflight, db::Metrics* metrics)
      : inflight_(inflight), metrics_(metrics) {
    ++*inflight_;
    if (metrics_) metrics_->inc_inflight();
  }
  ~InflightGuard() {
    if (metrics_) metrics_->dec_inflight();
    --*inflight_;
  }
};

}  // namespace

IngestRouter::IngestRouter(routing::RoutingTable* routing, int max_concurrency,
                           const std::string& machine_label,
                           db::Metrics* metrics)
    : routing_(routing),
      machine_label_(machine_label),
      metrics_(metrics),
      pool_(max_concurrency, static_cast<size_t>(max_concurrency), "ingest"),
      total_ingested_(0),
      total_failed_(0),
      inflight_(0) {}

IngestRouter::~IngestRouter() { stop(); }

void IngestRouter::stop() { pool_.stop(); }

void IngestRouter::record(int ok, int failed) {
  total_ingested_ += ok;
  total_failed_ += failed;
  if (metrics_) metrics_->add_ingested(ok, failed);
}

int IngestRouter::ingest(const partition::IngestBatch& batch) {
  std::map<int, std::pair<std::shared_ptr<partition::Partition>,
                          partition::IngestBatch>>
      groups;
  int unrouted = 0;
  for (const partition::MetricSample& m : batch.metrics) {
    std::pair<routing::Assignment, bool> r =
        routing_->route(label::lbs_get(m.labels, machine_label_));
    if (!r.second || !r.first.partition) {
      ++unrouted;
      LOG_WARN << "no partition for sample " << m.name
               << label::lbs_string(m.labels);
      continue;
    }
    auto it = groups.find(r.first.index);
    if (it == groups.end())
      it = groups
               .emplace(r.first.index,
                        std::make_pair(r.first.partition,
                                       partition::IngestBatch(batch.timestamp)))
               .first;
    it->second.second.metrics.push_back(m);
  }
  if (unrouted > 0) record(0, unrouted);

  std::atomic<int> count(0);
  base::WaitGroup wg;
  for (auto& g : groups) {
    std::shared_ptr<partition::Partition> p = g.second.first;
    const partition::IngestBatch* b = &g.second.second;
    wg.add(1);
    bool queued = pool_.run([this, p, b, &count, &wg]() {
      base::WaitGroupGuard done(&wg);
      InflightGuard inflight(&inflight_, metrics_);
      int n = p->ingest(*b);
      count += n;
      record(n, static_cast<int>(b->metrics.size()) - n);
    });
    if (!queued) {
      record(0, static_cast<int>(b->metrics.size()));
      wg.done();
    }
  }
  wg.wait();
  return count.load();
}

int IngestRouter::ingest_partition(
    const std::shared_ptr<partition::Partition>& p,
    const partition::IngestBatch& batch) {
  int count = 0;
  base::WaitGroup wg;
  wg.add(1);
  bool queued = pool_.run([this, &p, &batch, &count, &wg]() {
    base::WaitGroupGuard done(&wg);
    InflightGuard inflight(&inflight_, metrics_);
    count = p->ingest(batch);
    record(count, static_cast<int>(batch.metrics.size()) - count);
  });
  if (!queued) {
    record(0, static_cast<int>(batch.metrics.size()));
    return 0;
  }
  wg.wait();
  return count;
}

}  // namespace ingest
}  // namespace sketchdb
