#include <stdlib.h>

#include <boost/filesystem.hpp>
#include <fstream>

#include "db/Options.hpp"
#include "gtest/gtest.h"

namespace sketchdb {
namespace db {

class OptionsTest : public testing::Test {
 public:
  void TearDown() override {
    unsetenv("SKETCHDB_BASE_PORT");
    unsetenv("SKETCHDB_FUNCTIONS");
    unsetenv("SKETCHDB_NUM_TIMESERIES_INIT");
    unsetenv("SKETCHDB_MAX_PARTITIONS");
  }
};

TEST_F(OptionsTest, Defaults) {
  Options opts;
  ASSERT_FALSE(opts.validate());
  ASSERT_EQ(7000, opts.control_port);
  ASSERT_EQ(7100, opts.base_port);
  ASSERT_EQ(200, opts.machines_per_port);
  ASSERT_EQ(3u, opts.function_descs().size());
  ASSERT_EQ(20u, Options::keys().size());
}

TEST_F(OptionsTest, Set) {
  Options opts;
  ASSERT_FALSE(opts.set("control_port", "8000"));
  ASSERT_EQ(8000, opts.control_port);
  ASSERT_TRUE(opts.set("control_port", "80x"));
  ASSERT_TRUE(opts.set("control_port", ""));
  ASSERT_TRUE(opts.set("control_port", "99999999999"));
  ASSERT_EQ(8000, opts.control_port);
  ASSERT_TRUE(opts.set("value_scale", "big"));
  ASSERT_FALSE(opts.set("value_scale", "2.5"));
  ASSERT_DOUBLE_EQ(2.5, opts.value_scale);
  ASSERT_TRUE(opts.set("no_such_option", "1"));

  ASSERT_FALSE(opts.set("functions", "avg_over_time, quantile_over_time,"));
  ASSERT_EQ(std::vector<std::string>({"avg_over_time", "quantile_over_time"}),
            opts.functions);
  ASSERT_FALSE(opts.set("port_blocklist", "7101,7102"));
  ASSERT_EQ(std::vector<int>({7101, 7102}), opts.port_blocklist);
  ASSERT_TRUE(opts.set("port_blocklist", "7101,x"));
  ASSERT_EQ(std::vector<int>({7101, 7102}), opts.port_blocklist);
}

TEST_F(OptionsTest, PreallocateIsCapped) {
  Options opts;
  ASSERT_FALSE(opts.set("preallocate_series", "5000"));
  ASSERT_EQ(MAX_PREALLOCATE_SERIES, opts.preallocate_series);
  ASSERT_FALSE(opts.set("preallocate_series", "300"));
  ASSERT_EQ(300, opts.preallocate_series);
}

TEST_F(OptionsTest, Yaml) {
  Options opts;
  ASSERT_FALSE(opts.load_yaml(
      "control_port: 8000\n"
      "base_port: 8100\n"
      "functions: [avg_over_time, entropy_over_time]\n"
      "port_blocklist:\n"
      "  - 8200\n"
      "value_scale: 2.5\n"
      "log_level: debug\n"));
  ASSERT_EQ(8000, opts.control_port);
  ASSERT_EQ(8100, opts.base_port);
  ASSERT_EQ(2u, opts.functions.size());
  ASSERT_EQ("entropy_over_time", opts.functions[1]);
  ASSERT_EQ(std::vector<int>({8200}), opts.port_blocklist);
  ASSERT_DOUBLE_EQ(2.5, opts.value_scale);
  ASSERT_FALSE(opts.validate());

  ASSERT_FALSE(opts.load_yaml(""));
  ASSERT_TRUE(opts.load_yaml("bogus: 1\n"));
  ASSERT_TRUE(opts.load_yaml("- a\n- b\n"));
  ASSERT_TRUE(opts.load_yaml("control_port: [1, 2]\n"));
  ASSERT_TRUE(opts.load_yaml("control_port: {a: 1}\n"));
  ASSERT_TRUE(opts.load_yaml("control_port: [\n"));
}

TEST_F(OptionsTest, YamlFile) {
  Options opts;
  ASSERT_TRUE(opts.load_yaml_file("/tmp/sketchdb_options_test/missing.yaml"));

  boost::filesystem::create_directories("/tmp/sketchdb_options_test");
  {
    std::ofstream out("/tmp/sketchdb_options_test/sketchdb.yaml");
    out << "machines_per_port: 50\nlog_dir: /tmp/sketchdb_logs\n";
  }
  ASSERT_FALSE(opts.load_yaml_file("/tmp/sketchdb_options_test/sketchdb.yaml"));
  ASSERT_EQ(50, opts.machines_per_port);
  ASSERT_EQ("/tmp/sketchdb_logs", opts.log_dir);
}

TEST_F(OptionsTest, Env) {
  setenv("SKETCHDB_BASE_PORT", "9100", 1);
  setenv("SKETCHDB_FUNCTIONS", "quantile_over_time", 1);
  setenv("SKETCHDB_NUM_TIMESERIES_INIT", "4000", 1);
  Options opts;
  ASSERT_FALSE(opts.load_env());
  ASSERT_EQ(9100, opts.base_port);
  ASSERT_EQ(std::vector<std::string>({"quantile_over_time"}), opts.functions);
  ASSERT_EQ(MAX_PREALLOCATE_SERIES, opts.preallocate_series);

  setenv("SKETCHDB_MAX_PARTITIONS", "many", 1);
  error::Error err = opts.load_env();
  ASSERT_TRUE(err);
  ASSERT_NE(std::string::npos, err.error().find("SKETCHDB_MAX_PARTITIONS"));
}

TEST_F(OptionsTest, Validate) {
  Options opts;
  opts.control_port = 7105;
  ASSERT_TRUE(opts.validate());
  opts.control_port = 7100 + 64;
  ASSERT_FALSE(opts.validate());

  opts = Options();
  opts.port_blocklist = {7000, 9000};
  ASSERT_FALSE(opts.validate());
  opts.port_blocklist = {7163};
  ASSERT_TRUE(opts.validate());

  opts = Options();
  opts.machines_per_port = 0;
  ASSERT_TRUE(opts.validate());
  opts = Options();
  opts.max_partitions = 0;
  ASSERT_TRUE(opts.validate());
  opts = Options();
  opts.ingest_concurrency = 0;
  ASSERT_TRUE(opts.validate());
  opts = Options();
  opts.functions.clear();
  ASSERT_TRUE(opts.validate());
  opts.functions = {"rate"};
  error::Error err = opts.validate();
  ASSERT_TRUE(err);
  ASSERT_NE(std::string::npos, err.error().find("\"rate\""));
  ASSERT_NE(std::string::npos, err.error().find("quantile_over_time"));
  opts = Options();
  opts.log_level = "loud";
  ASSERT_TRUE(opts.validate());
  opts = Options();
  opts.machine_label = opts.metric_label;
  ASSERT_TRUE(opts.validate());
  opts = Options();
  opts.base_port = 65500;
  ASSERT_TRUE(opts.validate());
}

TEST_F(OptionsTest, Converters) {
  Options opts;
  opts.functions = {"avg_over_time", "avg_over_time", "quantile_over_time"};
  opts.port_blocklist = {9000};
  opts.machines_per_port = 50;
  opts.query_lock_timeout_ms = 30;
  opts.preallocate_series = 10;

  ASSERT_EQ(2u, opts.function_descs().size());
  routing::TableOptions t = opts.table_options();
  ASSERT_EQ(7000, t.control_port);
  ASSERT_EQ(1u, t.port_blocklist.count(9000));
  ASSERT_EQ(64, t.max_partitions);

  control::ControlOptions c = opts.control_options();
  ASSERT_EQ(50, c.machines_per_partition);
  ASSERT_EQ(10, c.preallocate_series);
  ASSERT_EQ(2u, c.functions.size());
  ASSERT_EQ(60000, c.sketch_options.time_window);

  query::EvaluatorOptions e = opts.evaluator_options();
  ASSERT_EQ(30, e.lock_timeout_ms);
  ASSERT_EQ("machineid", e.machine_label);
}

}  // namespace db
}  // namespace sketchdb

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
