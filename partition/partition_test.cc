#include <httplib.h>
#include <snappy.h>

#include <cmath>
#include <thread>

#include "db/HttpParser.hpp"
#include "db/Partition.pb.h"
#include "gtest/gtest.h"
#include "partition/Partition.hpp"
#include "partition/PartitionServer.hpp"

namespace sketchdb {
namespace partition {

class PartitionTest : public testing::Test {
 public:
  PartitionOptions options(int64_t begin, int64_t end) {
    PartitionOptions opts;
    opts.index = static_cast<int>(begin / 200);
    opts.port = 17150 + opts.index;
    opts.machine_begin = begin;
    opts.machine_end = end;
    opts.functions = {sketch::lookup_function("avg_over_time"),
                      sketch::lookup_function("quantile_over_time"),
                      sketch::lookup_function("entropy_over_time")};
    return opts;
  }

  MetricSample sample(const std::string& machine, double v) {
    return MetricSample("cpu", {{"machineid", machine}}, v);
  }

  label::Labels cpu_identity(const std::string& machine) {
    return label::lbs_from_map({{label::METRIC_NAME, "cpu"},
                                {"machineid", machine}});
  }
};

TEST_F(PartitionTest, IngestCountsOnlyValidSamples) {
  Partition p(options(0, 200));
  IngestBatch batch(1000);
  batch.metrics.push_back(sample("machine_1", 1));
  batch.metrics.push_back(sample("machine_2", 2));
  batch.metrics.push_back(sample("rack_199", 3));
  batch.metrics.push_back(sample("machine_200", 4));
  batch.metrics.push_back(sample("machine_3", std::nan("")));
  batch.metrics.push_back(MetricSample("cpu", {{"host", "a"}}, 5));
  batch.metrics.push_back(MetricSample("", {{"machineid", "machine_4"}}, 6));
  MetricSample bad;
  bad.err.set("value of cpu is missing or not a number");
  batch.metrics.push_back(bad);

  ASSERT_EQ(3, p.ingest(batch));
  ASSERT_EQ(3u, p.ingested_total());
  ASSERT_EQ(5u, p.failed_total());
  ASSERT_LT(0, p.last_insert_ms());
  // Three series, one instance per configured function.
  ASSERT_EQ(9u, p.num_sketches());
}

TEST_F(PartitionTest, InsertErrors) {
  Partition p(options(200, 400));
  ASSERT_EQ(ErrMachineOutOfRange, p.insert(1000, sample("machine_1", 1)));
  ASSERT_EQ(ErrMissingMachine, p.insert(1000, sample("machine", 1)));
  ASSERT_EQ(ErrInvalidValue, p.insert(1000, sample("machine_201", INFINITY)));
  ASSERT_EQ(ErrMissingMetricName,
            p.insert(1000, MetricSample("", {{"machineid", "machine_201"}}, 1)));
  ASSERT_FALSE(p.insert(1000, sample("machine_201", 1)));
  ASSERT_EQ(0u, p.failed_total());
}

TEST_F(PartitionTest, CoverageFollowsAcceptedInserts) {
  Partition p(options(0, 200));
  for (int64_t t = 1000; t <= 9000; t += 1000) {
    IngestBatch batch(t);
    batch.metrics.push_back(sample("machine_7", static_cast<double>(t)));
    ASSERT_EQ(1, p.ingest(batch));
  }
  IngestBatch late(500);
  late.metrics.push_back(sample("machine_7", 1));
  ASSERT_EQ(0, p.ingest(late));

  error::Error err = p.insert(400, sample("machine_7", 1));
  ASSERT_TRUE(err);
  ASSERT_NE(std::string::npos, err.error().find(ErrOutOfOrderSample.error()));

  std::shared_ptr<SketchInstance> s = p.lookup(
      cpu_identity("machine_7"), sketch::lookup_function("avg_over_time"));
  ASSERT_TRUE(s != nullptr);
  ASSERT_EQ(1000, s->min_time());
  ASSERT_EQ(9000, s->max_time());
  ASSERT_EQ(9u, s->num_samples());

  Coverage c;
  ASSERT_TRUE(s->coverage(1000, 9000, 100, &c));
  ASSERT_EQ(COVERED, c);
  ASSERT_TRUE(s->coverage(500, 9000, 100, &c));
  ASSERT_EQ(PARTIAL, c);
  ASSERT_TRUE(s->coverage(1000, 9500, 100, &c));
  ASSERT_EQ(PARTIAL, c);
  ASSERT_TRUE(s->coverage(10000, 20000, 100, &c));
  ASSERT_EQ(UNCOVERED, c);

  EvalResult r;
  ASSERT_TRUE(s->evaluate(sketch::lookup_function("avg_over_time"), 0, 1000,
                          9000, 0, 100, &r));
  ASSERT_EQ(COVERED, r.coverage);
  ASSERT_EQ(1u, r.vector.size());
  ASSERT_EQ(9000, r.vector[0].t);
  ASSERT_DOUBLE_EQ(5000, r.vector[0].v);
}

TEST_F(PartitionTest, SameTimestampIsAccepted) {
  Partition p(options(0, 200));
  ASSERT_FALSE(p.insert(1000, sample("machine_7", 1)));
  ASSERT_FALSE(p.insert(1000, sample("machine_7", 2)));
  std::shared_ptr<SketchInstance> s = p.lookup(
      cpu_identity("machine_7"), sketch::lookup_function("avg_over_time"));
  ASSERT_EQ(2u, s->num_samples());
}

TEST_F(PartitionTest, LookupResolvesSameKind) {
  Partition p(options(0, 200));
  ASSERT_FALSE(p.insert(1000, sample("machine_7", 1)));
  label::Labels id = cpu_identity("machine_7");

  std::shared_ptr<SketchInstance> s =
      p.lookup(id, sketch::lookup_function("stddev_over_time"));
  ASSERT_TRUE(s != nullptr);
  ASSERT_EQ(sketch::lookup_function("avg_over_time"), s->fn);
  s = p.lookup(id, sketch::lookup_function("l2_over_time"));
  ASSERT_TRUE(s != nullptr);
  ASSERT_EQ(sketch::lookup_function("entropy_over_time"), s->fn);
  ASSERT_TRUE(p.lookup(cpu_identity("machine_8"),
                       sketch::lookup_function("avg_over_time")) == nullptr);

  PartitionOptions opts = options(0, 200);
  opts.functions = {sketch::lookup_function("avg_over_time")};
  Partition q(opts);
  ASSERT_FALSE(q.insert(1000, sample("machine_7", 1)));
  ASSERT_TRUE(q.lookup(id, sketch::lookup_function("quantile_over_time")) ==
              nullptr);
}

TEST_F(PartitionTest, Preallocate) {
  Partition p(options(200, 400));
  ASSERT_EQ(150, p.preallocate(250, "fake_machine_metric"));
  ASSERT_EQ(150u, p.num_sketches());
  ASSERT_EQ(0, p.preallocate(250, "fake_machine_metric"));
  ASSERT_EQ(0, p.preallocate(100, "fake_machine_metric"));

  label::Labels id = p.identity("fake_machine_metric",
                                {{"machineid", "machine_249"}});
  std::shared_ptr<SketchInstance> s =
      p.lookup(id, sketch::lookup_function("avg_over_time"));
  ASSERT_TRUE(s != nullptr);
  ASSERT_EQ(0u, s->num_samples());
  Coverage c;
  ASSERT_TRUE(s->coverage(0, 1000, 100, &c));
  ASSERT_EQ(UNCOVERED, c);
}

TEST_F(PartitionTest, Summary) {
  Partition p(options(0, 200));
  ASSERT_FALSE(p.insert(1000, sample("machine_7", 1)));
  ASSERT_FALSE(p.insert(3000, sample("machine_7", 2)));
  p.preallocate(1, "fake_machine_metric");

  PartitionSummary pb;
  p.summary(&pb);
  ASSERT_EQ(0, pb.index());
  ASSERT_EQ(200, pb.machine_end());
  ASSERT_EQ(6u, pb.sketches());
  ASSERT_EQ(6, pb.instances_size());
  int populated = 0;
  for (int i = 0; i < pb.instances_size(); i++) {
    const InstanceSummary& is = pb.instances(i);
    if (is.samples() == 0) {
      ASSERT_EQ("machine_0", is.machine());
      continue;
    }
    ++populated;
    ASSERT_EQ("machine_7", is.machine());
    ASSERT_EQ(1000, is.min_time());
    ASSERT_EQ(3000, is.max_time());
    ASSERT_EQ(2u, is.samples());
  }
  ASSERT_EQ(3, populated);
}

TEST_F(PartitionTest, ConcurrentIngest) {
  Partition p(options(0, 200));
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&p, i, this]() {
      for (int64_t t = 1; t <= 500; t++) {
        IngestBatch batch(t);
        batch.metrics.push_back(sample("machine_" + std::to_string(i), 1));
        batch.metrics.push_back(sample("machine_100", 1));
        p.ingest(batch);
      }
    });
  }
  for (auto& t : threads) t.join();
  ASSERT_EQ(27u, p.num_sketches());
  ASSERT_EQ(8000u, p.ingested_total() + p.failed_total());
  for (int i = 0; i < 8; i++) {
    std::shared_ptr<SketchInstance> s =
        p.lookup(cpu_identity("machine_" + std::to_string(i)),
                 sketch::lookup_function("avg_over_time"));
    ASSERT_EQ(500u, s->num_samples());
  }
}

TEST_F(PartitionTest, Server) {
  std::shared_ptr<Partition> p = std::make_shared<Partition>(options(0, 200));
  PartitionServer server(p, nullptr);
  ASSERT_FALSE(server.start());

  httplib::Client cli("127.0.0.1", p->options().port);
  IngestBatch batch(1000);
  batch.metrics.push_back(sample("machine_1", 1));
  batch.metrics.push_back(sample("machine_900", 1));
  auto res = cli.Post("/ingest", db::batch_json(batch), "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(200, res->status);
  ASSERT_EQ(db::ingest_json(1), res->body);

  res = cli.Post("/ingest", "{\"Timestamp\":", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(400, res->status);

  res = cli.Post("/ingest",
                 "{\"timestamp\": 2000, \"metrics\": [{\"name\": \"cpu\", "
                 "\"labels\": {\"machineid\": \"machine_1\"}, \"value\": 3}]}",
                 "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(db::ingest_json(1), res->body);

  res = cli.Get("/debug-summary");
  ASSERT_TRUE(res);
  ASSERT_EQ(200, res->status);
  std::string data;
  ASSERT_TRUE(snappy::Uncompress(res->body.data(), res->body.size(), &data));
  PartitionSummary pb;
  ASSERT_TRUE(pb.ParseFromString(data));
  ASSERT_EQ(2u, pb.ingested_total());
  ASSERT_EQ(1u, pb.failed_total());
  ASSERT_EQ(3u, pb.sketches());

  res = cli.Get("/health");
  ASSERT_TRUE(res);
  ASSERT_EQ(200, res->status);

  server.stop();
  ASSERT_FALSE(cli.Get("/health"));
}

}  // namespace partition
}  // namespace sketchdb

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
