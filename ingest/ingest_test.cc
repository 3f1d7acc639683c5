#include <boost/filesystem.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "base/TimeStamp.hpp"
#include "base/WaitGroup.hpp"
#include "db/Metrics.hpp"
#include "gtest/gtest.h"
#include "ingest/IngestRouter.hpp"
#include "ingest/ThroughputMonitor.hpp"

namespace sketchdb {
namespace ingest {

class IngestTest : public testing::Test {
 public:
  routing::PartitionTable table;
  routing::RoutingTable routing;

  IngestTest() : table(routing::TableOptions()), routing(&table) {}

  void SetUp() override {
    std::pair<int, error::Error> p = table.extend(
        3, 10, [](const routing::Assignment& a) {
          partition::PartitionOptions opts;
          opts.index = a.index;
          opts.port = a.port;
          opts.machine_begin = a.machine_begin;
          opts.machine_end = a.machine_end;
          opts.functions = {sketch::lookup_function("avg_over_time")};
          return std::make_pair(std::make_shared<partition::Partition>(opts),
                                error::Error());
        });
    ASSERT_FALSE(p.second);
    ASSERT_EQ(3, p.first);
  }

  partition::MetricSample sample(const std::string& machine) {
    return partition::MetricSample("cpu", {{"machineid", machine}}, 1);
  }

  std::shared_ptr<partition::Partition> partition_at(int64_t machine) {
    std::pair<routing::Assignment, bool> r = routing.route(machine);
    EXPECT_TRUE(r.second);
    return r.first.partition;
  }
};

TEST_F(IngestTest, SplitsByPartition) {
  db::Metrics metrics;
  IngestRouter router(&routing, 4, "machineid", &metrics);

  partition::IngestBatch batch(1000);
  batch.metrics.push_back(sample("machine_1"));
  batch.metrics.push_back(sample("machine_2"));
  batch.metrics.push_back(sample("machine_15"));
  batch.metrics.push_back(sample("machine_29"));
  batch.metrics.push_back(sample("machine_30"));
  batch.metrics.push_back(partition::MetricSample("cpu", {{"host", "a"}}, 1));
  ASSERT_EQ(4, router.ingest(batch));

  ASSERT_EQ(4u, router.total_ingested());
  ASSERT_EQ(2u, router.total_failed());
  ASSERT_DOUBLE_EQ(4, metrics.total_ingested());
  ASSERT_DOUBLE_EQ(2, metrics.total_failed());
  ASSERT_EQ(2u, partition_at(0)->ingested_total());
  ASSERT_EQ(1u, partition_at(10)->ingested_total());
  ASSERT_EQ(1u, partition_at(20)->ingested_total());
  ASSERT_EQ(0, router.inflight());
}

TEST_F(IngestTest, PartialFailureStillCounts) {
  IngestRouter router(&routing, 2, "machineid");
  partition::IngestBatch batch(1000);
  batch.metrics.push_back(sample("machine_1"));
  batch.metrics.push_back(partition::MetricSample(
      "cpu", {{"machineid", "machine_2"}}, std::nan("")));
  ASSERT_EQ(1, router.ingest(batch));
  ASSERT_EQ(1u, router.total_ingested());
  ASSERT_EQ(1u, router.total_failed());

  partition::IngestBatch empty(2000);
  ASSERT_EQ(0, router.ingest(empty));
}

TEST_F(IngestTest, IngestPartition) {
  IngestRouter router(&routing, 2, "machineid");
  partition::IngestBatch batch(1000);
  batch.metrics.push_back(sample("machine_11"));
  batch.metrics.push_back(sample("machine_1"));
  ASSERT_EQ(1, router.ingest_partition(partition_at(10), batch));
  ASSERT_EQ(1u, router.total_ingested());
  ASSERT_EQ(1u, router.total_failed());
}

TEST_F(IngestTest, ConcurrencyCeiling) {
  IngestRouter router(&routing, 2, "machineid");
  ASSERT_EQ(2, router.max_concurrency());

  std::atomic<bool> done(false);
  std::atomic<int> peak(0);
  std::thread watcher([&]() {
    while (!done.load()) {
      int n = router.inflight();
      if (n > peak.load()) peak.store(n);
    }
  });

  std::vector<std::thread> writers;
  for (int w = 0; w < 8; w++) {
    writers.emplace_back([&router, w, this]() {
      for (int64_t t = 1; t <= 200; t++) {
        partition::IngestBatch batch(t);
        for (int m = w; m < 30; m += 8)
          batch.metrics.push_back(sample("machine_" + std::to_string(m)));
        router.ingest(batch);
      }
    });
  }
  for (auto& t : writers) t.join();
  done.store(true);
  watcher.join();

  ASSERT_LE(peak.load(), 2);
  ASSERT_EQ(0, router.inflight());
  // Writers 6 and 7 own three machines each, the others four.
  ASSERT_EQ(static_cast<uint64_t>((6 * 4 + 2 * 3) * 200),
            router.total_ingested() + router.total_failed());
  ASSERT_EQ(0u, router.total_failed());
}

TEST_F(IngestTest, StoppedRouterRejects) {
  IngestRouter router(&routing, 2, "machineid");
  router.stop();
  partition::IngestBatch batch(1000);
  batch.metrics.push_back(sample("machine_1"));
  batch.metrics.push_back(sample("machine_11"));
  ASSERT_EQ(0, router.ingest(batch));
  ASSERT_EQ(0, router.ingest_partition(partition_at(0), batch));
  ASSERT_EQ(0u, router.total_ingested());
  ASSERT_EQ(4u, router.total_failed());
}

TEST_F(IngestTest, ThrowingTaskReleasesWaiter) {
  base::ThreadPool pool(1, 1, "throw");
  base::WaitGroup wg;
  wg.add(1);
  ASSERT_TRUE(pool.run([&wg]() {
    base::WaitGroupGuard done(&wg);
    throw std::runtime_error("label allocation failed");
  }));
  wg.wait();

  std::atomic<int> ran(0);
  wg.add(1);
  ASSERT_TRUE(pool.run([&wg, &ran]() {
    base::WaitGroupGuard done(&wg);
    ++ran;
  }));
  wg.wait();
  ASSERT_EQ(1, ran.load());
  pool.stop();
}

TEST_F(IngestTest, ThroughputMonitor) {
  boost::filesystem::remove_all("/tmp/sketchdb_ingest_test");
  disk::CsvLog log("/tmp/sketchdb_ingest_test/throughput.csv",
                   {"timestamp_ms", "samples_per_sec", "total"});
  ASSERT_FALSE(log.error());

  IngestRouter router(&routing, 2, "machineid");
  ThroughputMonitor monitor(&router, 60000, &log);
  int64_t base = base::now_millis() + 10000;
  ASSERT_DOUBLE_EQ(0, monitor.sample(base));

  partition::IngestBatch batch(1000);
  for (int i = 0; i < 10; i++)
    batch.metrics.push_back(sample("machine_" + std::to_string(i)));
  ASSERT_EQ(10, router.ingest(batch));
  ASSERT_DOUBLE_EQ(5, monitor.sample(base + 2000));

  monitor.start();
  monitor.stop();

  std::ifstream in("/tmp/sketchdb_ingest_test/throughput.csv");
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  ASSERT_EQ(3u, lines.size());
  ASSERT_EQ("timestamp_ms,samples_per_sec,total", lines[0]);
  ASSERT_EQ(std::to_string(base + 2000) + "," + std::to_string(5.0) + ",10",
            lines[2]);
}

}  // namespace ingest
}  // namespace sketchdb

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
