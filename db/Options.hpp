#ifndef OPTIONS_H
#define OPTIONS_H

#include <string>
#include <vector>

#include "base/Error.hpp"
#include "control/ControlPlane.hpp"
#include "query/QueryEvaluator.hpp"
#include "routing/PartitionTable.hpp"

namespace sketchdb {
namespace db {

extern const int64_t MAX_PREALLOCATE_SERIES;

// Options are read from a YAML file, then SKETCHDB_<KEY> environment
// variables, then command-line flags. Every source goes through set(), so a
// key behaves the same wherever it comes from.
class Options {
 public:
  std::string control_host;
  int control_port;
  int base_port;
  int64_t machines_per_port;
  int max_partitions;
  std::vector<int> port_blocklist;
  std::vector<std::string> functions;
  int64_t time_window_ms;
  int64_t item_window;
  double value_scale;
  int ingest_concurrency;
  int64_t query_lock_timeout_ms;
  int64_t partition_timeout_ms;
  int64_t preallocate_series;
  std::string preallocate_metric;
  std::string metric_label;
  std::string machine_label;
  std::string log_dir;
  int64_t throughput_interval_ms;
  std::string log_level;

  Options();

  static const std::vector<std::string>& keys();

  // set parses value for key. Lists are comma separated.
  error::Error set(const std::string& key, const std::string& value);

  error::Error load_yaml_file(const std::string& path);
  error::Error load_yaml(const std::string& content);
  error::Error load_env();

  error::Error validate() const;

  std::vector<const sketch::FunctionDesc*> function_descs() const;
  sketch::SketchOptions sketch_options() const;
  routing::TableOptions table_options() const;
  control::ControlOptions control_options() const;
  query::EvaluatorOptions evaluator_options() const;
};

}  // namespace db
}  // namespace sketchdb

#endif
