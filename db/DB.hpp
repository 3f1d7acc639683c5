#pragma once

#include <httplib.h>

#include <memory>
#include <thread>

#include "base/Error.hpp"
#include "control/ControlPlane.hpp"
#include "db/Metrics.hpp"
#include "db/Options.hpp"
#include "disk/CsvLog.hpp"
#include "ingest/IngestRouter.hpp"
#include "ingest/ThroughputMonitor.hpp"
#include "query/QueryEvaluator.hpp"
#include "routing/RoutingTable.hpp"

namespace sketchdb {
namespace db {

// DB owns every component of a node and serves the control address:
//   POST /register_config  GET /parse  GET /query  POST /ingest
//   GET /debug-state       GET /metrics GET /health
class DB : boost::noncopyable {
 private:
  Options opts_;

  Metrics metrics_;
  routing::PartitionTable table_;
  routing::RoutingTable routing_;
  ingest::IngestRouter router_;
  control::ControlPlane control_;

  std::unique_ptr<disk::CsvLog> throughput_log_;
  std::unique_ptr<disk::CsvLog> aggregation_log_;
  std::unique_ptr<disk::CsvLog> coverage_log_;

  query::QueryEvaluator evaluator_;
  ingest::ThroughputMonitor monitor_;

  httplib::Server server_;
  std::unique_ptr<std::thread> thread_;

  void init_http_server();
  disk::CsvLog* open_log(std::unique_ptr<disk::CsvLog>* log,
                         const std::string& name,
                         const std::vector<std::string>& header);

 public:
  // serve_partitions = false keeps partitions in process without listeners.
  explicit DB(const Options& opts, bool serve_partitions = true);
  ~DB();

  // start binds the control address. Failing to bind is a startup error.
  error::Error start();
  void stop();

  control::ControlPlane* control() { return &control_; }
  ingest::IngestRouter* router() { return &router_; }
  query::QueryEvaluator* evaluator() { return &evaluator_; }
  routing::PartitionTable* table() { return &table_; }
  Metrics* metrics() { return &metrics_; }
  const Options& options() const { return opts_; }
};

// Builds a request from /query parameters. label_<name>=<value> parameters
// become equality filters.
error::Error parse_query_params(const httplib::Request& req,
                                query::QueryRequest* q);

int query_http_status(const query::QueryResult& result);

}  // namespace db
}  // namespace sketchdb
