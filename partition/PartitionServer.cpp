#include "partition/PartitionServer.hpp"

#include <snappy.h>

#include <chrono>

#include "base/Logging.hpp"
#include "db/HttpParser.hpp"
#include "db/Partition.pb.h"
#include "ingest/IngestRouter.hpp"

namespace sketchdb {
namespace partition {

PartitionServer::PartitionServer(const std::shared_ptr<Partition>& partition,
                                 ingest::IngestRouter* router)
    : partition_(partition), router_(router) {
  init_http_server();
}

PartitionServer::~PartitionServer() { stop(); }

void PartitionServer::init_http_server() {
  server_.Post(
      "/ingest", [this](const httplib::Request& req, httplib::Response& res) {
        IngestBatch batch;
        error::Error err = db::parse_ingest(req.body, &batch);
        if (err) {
          LOG_WARN << "partition " << partition_->options().index
                   << " bad ingest body: " << err.error();
          res.status = 400;
          res.set_content(db::error_json(err.error()), "application/json");
          return;
        }
        int count = router_ ? router_->ingest_partition(partition_, batch)
                            : partition_->ingest(batch);
        LOG_DEBUG << "partition " << partition_->options().index
                  << " ingested " << count << "/" << batch.metrics.size();
        res.set_content(db::ingest_json(count), "application/json");
      });

  server_.Get("/debug-summary",
              [this](const httplib::Request& req, httplib::Response& res) {
                PartitionSummary summary;
                partition_->summary(&summary);
                std::string data, compressed_data;
                summary.SerializeToString(&data);
                snappy::Compress(data.data(), data.size(), &compressed_data);
                res.set_content(compressed_data, "application/x-protobuf");
              });

  server_.Get("/health",
              [this](const httplib::Request& req, httplib::Response& res) {
                res.set_content(
                    db::health_json("partition " +
                                    std::to_string(partition_->options().index) +
                                    " is running."),
                    "application/json");
              });
}

error::Error PartitionServer::start() {
  const PartitionOptions& opts = partition_->options();
  if (!server_.bind_to_port(opts.host.c_str(), opts.port))
    return error::Error("cannot bind " + opts.host + ":" +
                        std::to_string(opts.port));
  thread_.reset(new std::thread([this]() { this->server_.listen_after_bind(); }));
  for (int i = 0; !server_.is_running(); i++) {
    if (i >= 5000) {
      stop();
      return error::Error("partition " + std::to_string(opts.index) +
                          " listener did not start");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  LOG_INFO << "partition " << opts.index << " listening on " << opts.host
           << ":" << opts.port;
  return error::Error();
}

void PartitionServer::stop() {
  server_.stop();
  if (thread_ && thread_->joinable()) thread_->join();
  thread_.reset();
}

}  // namespace partition
}  // namespace sketchdb
