#include "db/DB.hpp"

#include <boost/filesystem.hpp>
#include <chrono>

#include "base/Logging.hpp"
#include "base/TimeStamp.hpp"
#include "db/HttpParser.hpp"

namespace sketchdb {
namespace db {

namespace {

control::ControlOptions make_control_options(const Options& opts,
                                             bool serve_partitions) {
  control::ControlOptions c = opts.control_options();
  c.serve_partitions = serve_partitions;
  return c;
}

bool to_int64(const std::string& s, int64_t* v) {
  try {
    size_t pos = 0;
    *v = std::stoll(s, &pos);
    return pos == s.size();
  } catch (const std::exception& e) {
    return false;
  }
}

bool to_double(const std::string& s, double* v) {
  try {
    size_t pos = 0;
    *v = std::stod(s, &pos);
    return pos == s.size();
  } catch (const std::exception& e) {
    return false;
  }
}

const char* JSON = "application/json";

}  // namespace

DB::DB(const Options& opts, bool serve_partitions)
    : opts_(opts),
      table_(opts.table_options()),
      routing_(&table_),
      router_(&routing_, opts.ingest_concurrency, opts.machine_label,
              &metrics_),
      control_(&table_, &router_, make_control_options(opts, serve_partitions),
               &metrics_),
      evaluator_(&routing_, opts.evaluator_options(),
                 open_log(&aggregation_log_, "aggregation_debug.csv",
                          query::AGGREGATION_LOG_HEADER),
                 open_log(&coverage_log_, "coverage_debug.csv",
                          query::COVERAGE_LOG_HEADER),
                 &metrics_),
      monitor_(&router_, opts.throughput_interval_ms,
               open_log(&throughput_log_, "throughput.csv",
                        {"timestamp_ms", "samples_per_sec", "total"})) {
  init_http_server();
}

DB::~DB() { stop(); }

disk::CsvLog* DB::open_log(std::unique_ptr<disk::CsvLog>* log,
                           const std::string& name,
                           const std::vector<std::string>& header) {
  boost::filesystem::path p = boost::filesystem::path(opts_.log_dir) / name;
  log->reset(new disk::CsvLog(p.string(), header));
  if ((*log)->error()) {
    LOG_WARN << "disable " << name << ": " << (*log)->error().error();
    log->reset();
  }
  return log->get();
}

error::Error parse_query_params(const httplib::Request& req,
                                query::QueryRequest* q) {
  q->func = req.get_param_value("func");
  q->metric = req.get_param_value("metric");
  if (q->func.empty()) return error::Error("missing parameter func");
  if (!req.has_param("mint") || !to_int64(req.get_param_value("mint"), &q->mint))
    return error::Error("mint must be an integer timestamp in ms");
  if (!req.has_param("maxt") || !to_int64(req.get_param_value("maxt"), &q->maxt))
    return error::Error("maxt must be an integer timestamp in ms");
  if (req.has_param("args") && !req.get_param_value("args").empty()) {
    if (!to_double(req.get_param_value("args"), &q->arg))
      return error::Error("args must be a number");
    q->has_arg = true;
  }
  const std::string prefix = "label_";
  for (const auto& p : req.params) {
    if (p.first.size() > prefix.size() &&
        p.first.compare(0, prefix.size(), prefix) == 0)
      q->labels.emplace_back(p.first.substr(prefix.size()), p.second);
  }
  label::lbs_normalize(&q->labels);
  return error::Error();
}

int query_http_status(const query::QueryResult& result) {
  switch (result.status) {
    case query::QUERY_SUCCESS:
      return 200;
    case query::QUERY_PENDING:
      return 202;
    case query::QUERY_ERROR:
      return 400;
  }
  return 500;
}

void DB::init_http_server() {
  server_.Post("/register_config", [this](const httplib::Request& req,
                                          httplib::Response& res) {
    int64_t estimated = 0, mpp = 0;
    error::Error err = parse_register(req.body, &estimated, &mpp);
    if (!err) err = control_.validate(estimated, mpp);
    if (err) {
      LOG_INFO << "register_config rejected: " << err.error();
      res.status = 400;
      res.set_content(error_json(err.error()), JSON);
      return;
    }
    std::pair<control::PartitionPlan, error::Error> p =
        control_.register_config(estimated, mpp);
    if (p.second) {
      res.status = 500;
      res.set_content(error_json(p.second.error()), JSON);
      return;
    }
    res.set_content(register_json(p.first), JSON);
  });

  server_.Get("/parse", [this](const httplib::Request& req,
                               httplib::Response& res) {
    int64_t time = base::now_millis();
    if (req.has_param("time") && !to_int64(req.get_param_value("time"), &time)) {
      metrics_.inc_query(query::status_name(query::QUERY_ERROR));
      res.status = 400;
      res.set_content(error_json("time must be an integer timestamp in ms"),
                      JSON);
      return;
    }
    query::QueryRequest q;
    error::Error err =
        query::QueryParser(req.get_param_value("q")).parse(time, &q);
    if (err) {
      metrics_.inc_query(query::status_name(query::QUERY_ERROR));
      res.status = 400;
      res.set_content(error_json(err.error()), JSON);
      return;
    }
    query::QueryResult r = evaluator_.query(q);
    res.status = query_http_status(r);
    res.set_content(query_json(r), JSON);
  });

  server_.Get("/query", [this](const httplib::Request& req,
                               httplib::Response& res) {
    query::QueryRequest q;
    error::Error err = parse_query_params(req, &q);
    if (err) {
      metrics_.inc_query(query::status_name(query::QUERY_ERROR));
      res.status = 400;
      res.set_content(error_json(err.error()), JSON);
      return;
    }
    query::QueryResult r = evaluator_.query(q);
    res.status = query_http_status(r);
    res.set_content(query_json(r), JSON);
  });

  server_.Post("/ingest", [this](const httplib::Request& req,
                                 httplib::Response& res) {
    partition::IngestBatch batch;
    error::Error err = parse_ingest(req.body, &batch);
    if (err) {
      LOG_WARN << "bad ingest body: " << err.error();
      res.status = 400;
      res.set_content(error_json(err.error()), JSON);
      return;
    }
    int count = router_.ingest(batch);
    res.set_content(ingest_json(count), JSON);
  });

  server_.Get("/debug-state",
              [this](const httplib::Request& req, httplib::Response& res) {
                res.set_content(debug_state_json(control_.debug_state()),
                                JSON);
              });

  server_.Get("/metrics",
              [this](const httplib::Request& req, httplib::Response& res) {
                res.set_content(metrics_.serialize(),
                                "text/plain; version=0.0.4");
              });

  server_.Get("/health",
              [this](const httplib::Request& req, httplib::Response& res) {
                res.set_content(health_json("sketchdb is running."), JSON);
              });
}

error::Error DB::start() {
  if (!server_.bind_to_port(opts_.control_host.c_str(), opts_.control_port))
    return error::Error("cannot bind control address " + opts_.control_host +
                        ":" + std::to_string(opts_.control_port));
  thread_.reset(new std::thread([this]() { this->server_.listen_after_bind(); }));
  for (int i = 0; !server_.is_running(); i++) {
    if (i >= 5000) {
      stop();
      return error::Error("control listener did not start");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  monitor_.start();
  LOG_INFO << "control listening on " << opts_.control_host << ":"
           << opts_.control_port;
  return error::Error();
}

void DB::stop() {
  server_.stop();
  if (thread_ && thread_->joinable()) thread_->join();
  thread_.reset();
  monitor_.stop();
  control_.stop();
  router_.stop();
}

}  // namespace db
}  // namespace sketchdb
