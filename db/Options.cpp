#include "db/Options.hpp"

#include <stdlib.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "base/Logging.hpp"
#include "label/Label.hpp"

namespace sketchdb {
namespace db {

const int64_t MAX_PREALLOCATE_SERIES = 2000;

namespace {

error::Error parse_int64(const std::string& key, const std::string& value,
                         int64_t* out) {
  try {
    size_t pos = 0;
    int64_t v = std::stoll(value, &pos);
    if (pos != value.size()) throw std::invalid_argument(value);
    *out = v;
  } catch (const std::exception& e) {
    return error::Error(key + ": \"" + value + "\" is not an integer");
  }
  return error::Error();
}

error::Error parse_int(const std::string& key, const std::string& value,
                       int* out) {
  int64_t v;
  error::Error err = parse_int64(key, value, &v);
  if (err) return err;
  if (v < -2147483648LL || v > 2147483647LL)
    return error::Error(key + ": " + value + " out of range");
  *out = static_cast<int>(v);
  return error::Error();
}

error::Error parse_double(const std::string& key, const std::string& value,
                          double* out) {
  try {
    size_t pos = 0;
    double v = std::stod(value, &pos);
    if (pos != value.size()) throw std::invalid_argument(value);
    *out = v;
  } catch (const std::exception& e) {
    return error::Error(key + ": \"" + value + "\" is not a number");
  }
  return error::Error();
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    size_t b = item.find_first_not_of(" \t");
    size_t e = item.find_last_not_of(" \t");
    if (b == std::string::npos) continue;
    items.push_back(item.substr(b, e - b + 1));
  }
  return items;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string s;
  for (size_t i = 0; i < items.size(); i++) {
    if (i > 0) s += sep;
    s += items[i];
  }
  return s;
}

}  // namespace

Options::Options()
    : control_host("127.0.0.1"),
      control_port(7000),
      base_port(7100),
      machines_per_port(200),
      max_partitions(64),
      functions({"avg_over_time", "quantile_over_time", "entropy_over_time"}),
      time_window_ms(60 * 1000),
      item_window(100000),
      value_scale(10000),
      ingest_concurrency(16),
      query_lock_timeout_ms(100),
      partition_timeout_ms(1000),
      preallocate_series(0),
      preallocate_metric("fake_machine_metric"),
      metric_label(label::METRIC_NAME),
      machine_label("machineid"),
      log_dir("logs"),
      throughput_interval_ms(5000),
      log_level("info") {}

const std::vector<std::string>& Options::keys() {
  static const std::vector<std::string> k = {
      "control_host",          "control_port",
      "base_port",             "machines_per_port",
      "max_partitions",        "port_blocklist",
      "functions",             "time_window_ms",
      "item_window",           "value_scale",
      "ingest_concurrency",    "query_lock_timeout_ms",
      "partition_timeout_ms",  "preallocate_series",
      "preallocate_metric",    "metric_label",
      "machine_label",         "log_dir",
      "throughput_interval_ms", "log_level"};
  return k;
}

error::Error Options::set(const std::string& key, const std::string& value) {
  if (key == "control_host") {
    control_host = value;
  } else if (key == "control_port") {
    return parse_int(key, value, &control_port);
  } else if (key == "base_port") {
    return parse_int(key, value, &base_port);
  } else if (key == "machines_per_port") {
    return parse_int64(key, value, &machines_per_port);
  } else if (key == "max_partitions") {
    return parse_int(key, value, &max_partitions);
  } else if (key == "port_blocklist") {
    std::vector<int> ports;
    for (const std::string& item : split_list(value)) {
      int port;
      error::Error err = parse_int(key, item, &port);
      if (err) return err;
      ports.push_back(port);
    }
    port_blocklist.swap(ports);
  } else if (key == "functions") {
    functions = split_list(value);
  } else if (key == "time_window_ms") {
    return parse_int64(key, value, &time_window_ms);
  } else if (key == "item_window") {
    return parse_int64(key, value, &item_window);
  } else if (key == "value_scale") {
    return parse_double(key, value, &value_scale);
  } else if (key == "ingest_concurrency") {
    return parse_int(key, value, &ingest_concurrency);
  } else if (key == "query_lock_timeout_ms") {
    return parse_int64(key, value, &query_lock_timeout_ms);
  } else if (key == "partition_timeout_ms") {
    return parse_int64(key, value, &partition_timeout_ms);
  } else if (key == "preallocate_series") {
    error::Error err = parse_int64(key, value, &preallocate_series);
    if (err) return err;
    if (preallocate_series > MAX_PREALLOCATE_SERIES) {
      LOG_WARN << "preallocate_series " << preallocate_series
               << " capped at " << MAX_PREALLOCATE_SERIES;
      preallocate_series = MAX_PREALLOCATE_SERIES;
    }
  } else if (key == "preallocate_metric") {
    preallocate_metric = value;
  } else if (key == "metric_label") {
    metric_label = value;
  } else if (key == "machine_label") {
    machine_label = value;
  } else if (key == "log_dir") {
    log_dir = value;
  } else if (key == "throughput_interval_ms") {
    return parse_int64(key, value, &throughput_interval_ms);
  } else if (key == "log_level") {
    log_level = value;
  } else {
    return error::Error("unknown option \"" + key + "\"");
  }
  return error::Error();
}

error::Error Options::load_yaml_file(const std::string& path) {
  std::string content;
  try {
    YAML::Node root = YAML::LoadFile(path);
    std::stringstream ss;
    ss << root;
    content = ss.str();
  } catch (const YAML::Exception& e) {
    return error::Error("config " + path + ": " + e.what());
  }
  return error::wrap(load_yaml(content), "config " + path);
}

error::Error Options::load_yaml(const std::string& content) {
  try {
    YAML::Node root = YAML::Load(content);
    if (root.IsNull()) return error::Error();
    if (!root.IsMap()) return error::Error("top level is not a map");
    for (YAML::const_iterator it = root.begin(); it != root.end(); ++it) {
      std::string key = it->first.as<std::string>();
      const YAML::Node& node = it->second;
      std::string value;
      if (node.IsSequence()) {
        for (size_t i = 0; i < node.size(); i++) {
          if (i > 0) value.push_back(',');
          value.append(node[i].as<std::string>());
        }
      } else if (node.IsScalar()) {
        value = node.as<std::string>();
      } else if (!node.IsNull()) {
        return error::Error(key + ": unsupported value");
      }
      error::Error err = set(key, value);
      if (err) return err;
    }
  } catch (const YAML::Exception& e) {
    return error::Error(e.what());
  }
  return error::Error();
}

error::Error Options::load_env() {
  std::vector<std::pair<std::string, std::string>> vars;
  for (const std::string& key : keys()) {
    std::string name = "SKETCHDB_" + key;
    std::transform(name.begin(), name.end(), name.begin(), ::toupper);
    vars.push_back({name, key});
  }
  vars.push_back({"SKETCHDB_NUM_TIMESERIES_INIT", "preallocate_series"});
  for (const auto& v : vars) {
    const char* value = getenv(v.first.c_str());
    if (value == nullptr) continue;
    error::Error err = set(v.second, value);
    if (err) return error::wrap(err, v.first);
  }
  return error::Error();
}

error::Error Options::validate() const {
  if (control_port <= 0 || control_port > 65535)
    return error::Error("control_port " + std::to_string(control_port) +
                        " out of range");
  if (max_partitions <= 0) return error::Error("max_partitions must be positive");
  if (base_port <= 0 || base_port + max_partitions - 1 > 65535)
    return error::Error("partition ports [" + std::to_string(base_port) + ", " +
                        std::to_string(base_port + max_partitions) +
                        ") out of range");
  int end = base_port + max_partitions;
  if (control_port >= base_port && control_port < end)
    return error::Error("control_port " + std::to_string(control_port) +
                        " lies in the partition ports [" +
                        std::to_string(base_port) + ", " +
                        std::to_string(end) + ")");
  for (int port : port_blocklist) {
    if (port >= base_port && port < end)
      return error::Error("blocked port " + std::to_string(port) +
                          " lies in the partition ports [" +
                          std::to_string(base_port) + ", " +
                          std::to_string(end) + ")");
  }
  if (machines_per_port <= 0)
    return error::Error("machines_per_port must be positive");
  if (functions.empty()) return error::Error("no functions configured");
  for (const std::string& f : functions) {
    if (sketch::lookup_function(f) == nullptr)
      return error::Error("unknown function \"" + f + "\", known: " +
                          join(sketch::function_names(), ", "));
  }
  if (time_window_ms <= 0) return error::Error("time_window_ms must be positive");
  if (item_window <= 0) return error::Error("item_window must be positive");
  if (!(value_scale > 0)) return error::Error("value_scale must be positive");
  if (ingest_concurrency <= 0)
    return error::Error("ingest_concurrency must be positive");
  if (query_lock_timeout_ms < 0)
    return error::Error("query_lock_timeout_ms must not be negative");
  if (partition_timeout_ms <= 0)
    return error::Error("partition_timeout_ms must be positive");
  if (preallocate_series < 0)
    return error::Error("preallocate_series must not be negative");
  if (throughput_interval_ms <= 0)
    return error::Error("throughput_interval_ms must be positive");
  if (metric_label.empty() || machine_label.empty())
    return error::Error("metric_label and machine_label must be set");
  if (metric_label == machine_label)
    return error::Error("metric_label and machine_label must differ");
  base::Logger::LogLevel level;
  if (!base::Logger::parse_log_level(log_level, &level))
    return error::Error("unknown log_level \"" + log_level + "\"");
  return error::Error();
}

std::vector<const sketch::FunctionDesc*> Options::function_descs() const {
  std::vector<const sketch::FunctionDesc*> descs;
  for (const std::string& f : functions) {
    const sketch::FunctionDesc* d = sketch::lookup_function(f);
    if (d != nullptr && std::find(descs.begin(), descs.end(), d) == descs.end())
      descs.push_back(d);
  }
  return descs;
}

sketch::SketchOptions Options::sketch_options() const {
  return sketch::SketchOptions(time_window_ms, item_window, value_scale);
}

routing::TableOptions Options::table_options() const {
  routing::TableOptions t;
  t.host = control_host;
  t.control_port = control_port;
  t.base_port = base_port;
  t.max_partitions = max_partitions;
  t.port_blocklist.insert(port_blocklist.begin(), port_blocklist.end());
  return t;
}

control::ControlOptions Options::control_options() const {
  control::ControlOptions c;
  c.machines_per_partition = machines_per_port;
  c.functions = function_descs();
  c.sketch_options = sketch_options();
  c.metric_label = metric_label;
  c.machine_label = machine_label;
  c.preallocate_series = preallocate_series;
  c.preallocate_metric = preallocate_metric;
  c.partition_timeout_ms = partition_timeout_ms;
  return c;
}

query::EvaluatorOptions Options::evaluator_options() const {
  query::EvaluatorOptions e;
  e.functions = function_descs();
  e.metric_label = metric_label;
  e.machine_label = machine_label;
  e.lock_timeout_ms = query_lock_timeout_ms;
  return e;
}

}  // namespace db
}  // namespace sketchdb
