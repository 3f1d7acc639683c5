#ifndef QUERYEVALUATOR_H
#define QUERYEVALUATOR_H

#include <string>
#include <vector>

#include "base/TimeStamp.hpp"
#include "disk/CsvLog.hpp"
#include "query/QueryParser.hpp"
#include "routing/RoutingTable.hpp"
#include "sketch/SketchInterface.hpp"

namespace sketchdb {
namespace db {
class Metrics;
}

namespace query {

enum QueryStatus {
  QUERY_SUCCESS,
  QUERY_PENDING,
  QUERY_ERROR,
};

const char* status_name(QueryStatus s);

class QueryResult {
 public:
  QueryStatus status;
  sketch::Vector data;
  sketch::Annotations annotations;
  double latency_ms;
  error::Error err;

  QueryResult() : status(QUERY_PENDING), latency_ms(0) {}
};

class EvaluatorOptions {
 public:
  std::vector<const sketch::FunctionDesc*> functions;
  std::string metric_label;
  std::string machine_label;
  int64_t lock_timeout_ms;

  EvaluatorOptions()
      : metric_label(label::METRIC_NAME),
        machine_label("machineid"),
        lock_timeout_ms(100) {}
};

// QueryEvaluator answers a query only when the owning sketch instance covers
// the whole window. Anything short of that is reported as pending. It never
// changes coverage state.
class QueryEvaluator {
 private:
  routing::RoutingTable* routing_;
  EvaluatorOptions opts_;
  disk::CsvLog* aggregation_log_;
  disk::CsvLog* coverage_log_;
  db::Metrics* metrics_;

  QueryResult finish(const QueryRequest& req, QueryResult r,
                     const base::Timer& timer);
  void log_coverage(const QueryRequest& req, const label::Labels& identity,
                    const char* state, int64_t now);

 public:
  // The logs and metrics may be nullptr.
  QueryEvaluator(routing::RoutingTable* routing, const EvaluatorOptions& opts,
                 disk::CsvLog* aggregation_log = nullptr,
                 disk::CsvLog* coverage_log = nullptr,
                 db::Metrics* metrics = nullptr);

  // validate checks everything that does not depend on ingested data.
  error::Error validate(const QueryRequest& req) const;

  QueryResult query(const QueryRequest& req);
  QueryResult query(const QueryRequest& req, int64_t now);
};

// filter_vector drops entries with a NaN value or a zero timestamp.
sketch::Vector filter_vector(const sketch::Vector& v);

extern const std::vector<std::string> AGGREGATION_LOG_HEADER;
extern const std::vector<std::string> COVERAGE_LOG_HEADER;

}  // namespace query
}  // namespace sketchdb

#endif
