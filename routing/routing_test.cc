#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "base/TimeStamp.hpp"
#include "gtest/gtest.h"
#include "partition/Partition.hpp"
#include "routing/RoutingTable.hpp"

namespace sketchdb {
namespace routing {

class RoutingTest : public testing::Test {
 public:
  std::atomic<int> provisioned;

  RoutingTest() : provisioned(0) {}

  PartitionTable::ProvisionFunc counting_provision() {
    return [this](const Assignment& a) {
      ++provisioned;
      partition::PartitionOptions opts;
      opts.index = a.index;
      opts.port = a.port;
      opts.machine_begin = a.machine_begin;
      opts.machine_end = a.machine_end;
      return std::make_pair(std::make_shared<partition::Partition>(opts),
                            error::Error());
    };
  }
};

TEST_F(RoutingTest, ControlPortIsNeverAssignable) {
  TableOptions opts;
  opts.control_port = 7102;
  opts.port_blocklist.insert(7105);
  PartitionTable table(opts);

  ASSERT_TRUE(table.validate_port(7102));
  ASSERT_TRUE(table.validate_port(7105));
  ASSERT_TRUE(table.validate_port(0));
  ASSERT_FALSE(table.validate_port(7101));

  ASSERT_FALSE(table.validate_plan(200, 2));
  ASSERT_TRUE(table.validate_plan(200, 3));
  ASSERT_TRUE(table.validate_plan(0, 1));

  std::pair<int, error::Error> p = table.extend(3, 200, counting_provision());
  ASSERT_TRUE(p.second);
  ASSERT_EQ(0, p.first);
  ASSERT_EQ(0, table.size());
  ASSERT_EQ(0, provisioned.load());
}

TEST_F(RoutingTest, ExtendNeverShrinksOrMoves) {
  PartitionTable table((TableOptions()));
  RoutingTable routing(&table);

  ASSERT_FALSE(routing.route("machine_0").second);

  std::pair<int, error::Error> p = table.extend(2, 200, counting_provision());
  ASSERT_FALSE(p.second);
  ASSERT_EQ(2, p.first);

  std::pair<Assignment, bool> r = routing.route("machine_250");
  ASSERT_TRUE(r.second);
  ASSERT_EQ(1, r.first.index);
  ASSERT_EQ(7101, r.first.port);
  ASSERT_EQ(200, r.first.machine_begin);
  ASSERT_EQ(400, r.first.machine_end);
  ASSERT_FALSE(routing.route("machine_400").second);

  p = table.extend(1, 200, counting_provision());
  ASSERT_FALSE(p.second);
  ASSERT_EQ(0, p.first);
  ASSERT_EQ(2, table.size());

  p = table.extend(3, 200, counting_provision());
  ASSERT_EQ(1, p.first);
  ASSERT_EQ(3, provisioned.load());

  // Earlier machines keep their partition.
  ASSERT_EQ(1, routing.route("machine_250").first.index);
  ASSERT_EQ(2, routing.route("machine_400").first.index);
  ASSERT_EQ(7102, routing.route(int64_t(599)).first.port);
  ASSERT_FALSE(routing.route("machine_600").second);
  ASSERT_FALSE(routing.route("nomachine").second);

  ASSERT_TRUE(table.extend(4, 100, counting_provision()).second);
  ASSERT_EQ(3, table.size());
}

TEST_F(RoutingTest, RouteIsStable) {
  PartitionTable table((TableOptions()));
  RoutingTable routing(&table);
  ASSERT_FALSE(table.extend(4, 10, counting_provision()).second);
  for (int64_t m = 0; m < 40; m++) {
    std::pair<Assignment, bool> r1 = routing.route(m);
    std::pair<Assignment, bool> r2 = routing.route(m);
    ASSERT_TRUE(r1.second);
    ASSERT_EQ(r1.first.port, r2.first.port);
    ASSERT_EQ(m / 10, r1.first.index);
    ASSERT_TRUE(r1.first.partition->owns(m));
  }
}

TEST_F(RoutingTest, ConcurrentExtendProvisionsOnce) {
  PartitionTable table((TableOptions()));
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([this, &table]() {
      table.extend(5, 200, counting_provision());
    });
  }
  for (auto& t : threads) t.join();
  ASSERT_EQ(5, table.size());
  ASSERT_EQ(5, provisioned.load());
}

TEST_F(RoutingTest, RouteDoesNotWaitForProvisioning) {
  PartitionTable table((TableOptions()));
  RoutingTable routing(&table);
  ASSERT_FALSE(table.extend(1, 200, counting_provision()).second);

  std::atomic<bool> started(false);
  auto slow = [this, &started](const Assignment& a) {
    started = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    return counting_provision()(a);
  };
  std::thread t([&table, &slow]() {
    ASSERT_FALSE(table.extend(3, 200, slow).second);
  });
  while (!started) std::this_thread::sleep_for(std::chrono::milliseconds(1));

  base::Timer timer;
  std::pair<Assignment, bool> r = routing.route("machine_3");
  ASSERT_TRUE(r.second);
  ASSERT_EQ(0, r.first.index);
  ASSERT_FALSE(routing.route("machine_250").second);
  ASSERT_LT(timer.since_start_millis(), 500);

  // A second registration waits for the first instead of provisioning again.
  ASSERT_EQ(0, table.extend(3, 200, counting_provision()).first);
  t.join();
  ASSERT_EQ(3, table.size());
  ASSERT_EQ(3, provisioned.load());
}

TEST_F(RoutingTest, ProvisionFailureKeepsEarlierPartitions) {
  PartitionTable table((TableOptions()));
  auto fail_third = [this](const Assignment& a) {
    if (a.index == 2)
      return std::make_pair(std::shared_ptr<partition::Partition>(),
                            error::Error("bind failed"));
    return counting_provision()(a);
  };
  std::pair<int, error::Error> p = table.extend(4, 100, fail_third);
  ASSERT_TRUE(p.second);
  ASSERT_EQ(2, p.first);
  ASSERT_EQ(2, table.size());
}

}  // namespace routing
}  // namespace sketchdb

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
