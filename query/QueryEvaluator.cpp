#include "query/QueryEvaluator.hpp"

#include <cmath>
#include <sstream>

#include "base/Logging.hpp"
#include "db/Metrics.hpp"
#include "partition/Partition.hpp"

namespace sketchdb {
namespace query {

const std::vector<std::string> AGGREGATION_LOG_HEADER = {
    "timestamp_ms", "function", "series",         "mint",
    "maxt",         "arg",      "sketch_samples", "results",
    "latency_ms"};
const std::vector<std::string> COVERAGE_LOG_HEADER = {
    "timestamp_ms", "function", "series", "mint", "maxt", "state"};

const char* status_name(QueryStatus s) {
  switch (s) {
    case QUERY_SUCCESS:
      return "success";
    case QUERY_PENDING:
      return "pending";
    case QUERY_ERROR:
      return "error";
  }
  return "unknown";
}

sketch::Vector filter_vector(const sketch::Vector& v) {
  sketch::Vector out;
  out.reserve(v.size());
  for (const sketch::Sample& s : v) {
    if (std::isnan(s.v) || s.t == 0) continue;
    out.push_back(s);
  }
  return out;
}

QueryEvaluator::QueryEvaluator(routing::RoutingTable* routing,
                               const EvaluatorOptions& opts,
                               disk::CsvLog* aggregation_log,
                               disk::CsvLog* coverage_log,
                               db::Metrics* metrics)
    : routing_(routing),
      opts_(opts),
      aggregation_log_(aggregation_log),
      coverage_log_(coverage_log),
      metrics_(metrics) {}

error::Error QueryEvaluator::validate(const QueryRequest& req) const {
  const sketch::FunctionDesc* fn = sketch::lookup_function(req.func);
  if (fn == nullptr) return error::Error("unknown function \"" + req.func + "\"");
  error::Error err = sketch::validate_argument(fn, req.has_arg, req.arg);
  if (err) return err;
  if (req.metric.empty()) return error::Error("missing metric name");
  if (req.mint > req.maxt)
    return error::Error("mint " + std::to_string(req.mint) +
                        " is after maxt " + std::to_string(req.maxt));
  if (sketch::resolve_function(opts_.functions, fn) == nullptr)
    return error::Error("function " + req.func + " is not enabled");
  std::string machine = label::lbs_get(req.labels, opts_.machine_label);
  if (machine.empty())
    return error::Error("missing label " + opts_.machine_label);
  if (!label::parse_machine_index(machine).second)
    return error::Error("cannot parse machine index from \"" + machine + "\"");
  return error::Error();
}

QueryResult QueryEvaluator::query(const QueryRequest& req) {
  return query(req, base::now_millis());
}

QueryResult QueryEvaluator::query(const QueryRequest& req, int64_t now) {
  base::Timer timer;
  QueryResult r;

  r.err = validate(req);
  if (r.err) {
    r.status = QUERY_ERROR;
    return finish(req, r, timer);
  }
  const sketch::FunctionDesc* fn = sketch::lookup_function(req.func);

  std::pair<routing::Assignment, bool> route =
      routing_->route(label::lbs_get(req.labels, opts_.machine_label));
  if (!route.second || !route.first.partition) {
    LOG_DEBUG << "query " << req.func << " " << req.metric
              << label::lbs_string(req.labels) << ": machine not assigned";
    r.status = QUERY_PENDING;
    return finish(req, r, timer);
  }

  partition::Partition* p = route.first.partition.get();
  label::Labels identity = p->identity(req.metric, req.labels);
  std::shared_ptr<partition::SketchInstance> instance = p->lookup(identity, fn);
  if (!instance) {
    log_coverage(req, identity, partition::coverage_name(partition::UNCOVERED),
                 now);
    r.status = QUERY_PENDING;
    return finish(req, r, timer);
  }

  partition::EvalResult eval;
  if (!instance->evaluate(fn, req.arg, req.mint, req.maxt, now,
                          opts_.lock_timeout_ms, &eval)) {
    LOG_WARN << "query " << req.func << " " << label::lbs_string(identity)
             << ": instance lock timed out after " << opts_.lock_timeout_ms
             << "ms";
    log_coverage(req, identity, "lock_timeout", now);
    r.status = QUERY_PENDING;
    return finish(req, r, timer);
  }
  log_coverage(req, identity, partition::coverage_name(eval.coverage), now);
  if (eval.coverage != partition::COVERED) {
    r.status = QUERY_PENDING;
    return finish(req, r, timer);
  }

  r.status = QUERY_SUCCESS;
  r.data = filter_vector(eval.vector);
  r.annotations = eval.annotations;
  r = finish(req, r, timer);

  if (aggregation_log_) {
    std::ostringstream latency;
    latency << r.latency_ms;
    std::string sample_count;
    auto it = r.annotations.find("sketch_exec_sample_count");
    if (it != r.annotations.end()) sample_count = it->second;
    error::Error err = aggregation_log_->append(
        {std::to_string(now), req.func, label::lbs_string(identity),
         std::to_string(req.mint), std::to_string(req.maxt),
         req.has_arg ? std::to_string(req.arg) : "", sample_count,
         std::to_string(r.data.size()), latency.str()});
    if (err) LOG_WARN << err.error();
  }
  return r;
}

QueryResult QueryEvaluator::finish(const QueryRequest& req, QueryResult r,
                                   const base::Timer& timer) {
  r.latency_ms = timer.since_start_millis();
  if (metrics_) metrics_->inc_query(status_name(r.status));
  if (r.status == QUERY_ERROR)
    LOG_INFO << "query " << req.func << " rejected: " << r.err.error();
  else
    LOG_DEBUG << "query " << req.func << " " << req.metric
              << label::lbs_string(req.labels) << " [" << req.mint << ", "
              << req.maxt << "] " << status_name(r.status) << " "
              << r.data.size() << " result(s) in " << r.latency_ms << "ms";
  return r;
}

void QueryEvaluator::log_coverage(const QueryRequest& req,
                                  const label::Labels& identity,
                                  const char* state, int64_t now) {
  if (!coverage_log_) return;
  error::Error err = coverage_log_->append(
      {std::to_string(now), req.func, label::lbs_string(identity),
       std::to_string(req.mint), std::to_string(req.maxt), state});
  if (err) LOG_WARN << err.error();
}

}  // namespace query
}  // namespace sketchdb
