#ifndef PARTITIONSERVER_H
#define PARTITIONSERVER_H

#include <httplib.h>

#include <memory>
#include <thread>

#include "partition/Partition.hpp"

namespace sketchdb {
namespace ingest {
class IngestRouter;
}

namespace partition {

// PartitionServer serves one partition on its own port:
//   POST /ingest         JSON batch, answered with the ingested count.
//   GET  /debug-summary  PartitionSummary protobuf, snappy compressed.
//   GET  /health
class PartitionServer : boost::noncopyable {
 private:
  std::shared_ptr<Partition> partition_;
  ingest::IngestRouter* router_;
  httplib::Server server_;
  std::unique_ptr<std::thread> thread_;

  void init_http_server();

 public:
  // Inserts go through router when it is not nullptr.
  PartitionServer(const std::shared_ptr<Partition>& partition,
                  ingest::IngestRouter* router);
  ~PartitionServer();

  // start binds the partition address and serves it on a background thread.
  error::Error start();
  void stop();

  const std::shared_ptr<Partition>& partition() const { return partition_; }
};

}  // namespace partition
}  // namespace sketchdb

#endif
