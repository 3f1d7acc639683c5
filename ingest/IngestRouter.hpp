#ifndef INGESTROUTER_H
#define INGESTROUTER_H

#include <atomic>
#include <memory>

#include "base/ThreadPool.hpp"
#include "partition/Partition.hpp"
#include "routing/RoutingTable.hpp"

namespace sketchdb {
namespace db {
class Metrics;
}

namespace ingest {

// IngestRouter is the process-wide admission gate for inserts. At most
// max_concurrency partition batches are inserted at once; further callers
// wait in ThreadPool::run() for a queue slot.
class IngestRouter : boost::noncopyable {
 private:
  routing::RoutingTable* routing_;
  std::string machine_label_;
  db::Metrics* metrics_;
  base::ThreadPool pool_;

  std::atomic<uint64_t> total_ingested_;
  std::atomic<uint64_t> total_failed_;
  std::atomic<int> inflight_;

  void record(int ok, int failed);

 public:
  IngestRouter(routing::RoutingTable* routing, int max_concurrency,
               const std::string& machine_label,
               db::Metrics* metrics = nullptr);
  ~IngestRouter();

  // ingest splits a batch of any machines by owning partition and inserts
  // the groups in parallel. Samples of unknown machines count as failed.
  // Returns the number of samples ingested.
  int ingest(const partition::IngestBatch& batch);

  // ingest_partition inserts a batch addressed to one partition.
  int ingest_partition(const std::shared_ptr<partition::Partition>& p,
                       const partition::IngestBatch& batch);

  void stop();

  uint64_t total_ingested() const { return total_ingested_.load(); }
  uint64_t total_failed() const { return total_failed_.load(); }
  int inflight() const { return inflight_.load(); }
  int max_concurrency() const { return pool_.num_threads(); }
};

}  // namespace ingest
}  // namespace sketchdb

#endif
