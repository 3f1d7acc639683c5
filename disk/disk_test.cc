#include "disk/CsvLog.hpp"

#include <boost/filesystem.hpp>
#include <fstream>

#include "gtest/gtest.h"

namespace sketchdb {
namespace disk {

class CsvLogTest : public testing::Test {
 public:
  std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
  }
};

TEST_F(CsvLogTest, HeaderOnlyOnce) {
  boost::filesystem::remove_all("/tmp/sketchdb_csv_test");
  std::string path = "/tmp/sketchdb_csv_test/sub/throughput.csv";
  {
    CsvLog log(path, {"timestamp_ms", "samples_per_sec", "total"});
    ASSERT_FALSE(log.error());
    ASSERT_FALSE(log.append({"1000", "12.5", "25"}));
  }
  {
    CsvLog log(path, {"timestamp_ms", "samples_per_sec", "total"});
    ASSERT_FALSE(log.append({"2000", "10", "35"}));
  }
  std::vector<std::string> lines = read_lines(path);
  ASSERT_EQ(3u, lines.size());
  ASSERT_EQ("timestamp_ms,samples_per_sec,total", lines[0]);
  ASSERT_EQ("1000,12.5,25", lines[1]);
  ASSERT_EQ("2000,10,35", lines[2]);
}

TEST_F(CsvLogTest, Escape) {
  ASSERT_EQ("plain", csv_escape("plain"));
  ASSERT_EQ("\"{a=\"\"b\"\", c=\"\"d\"\"}\"", csv_escape("{a=\"b\", c=\"d\"}"));
}

TEST_F(CsvLogTest, UnwritableDirectory) {
  boost::filesystem::remove_all("/tmp/sketchdb_csv_file");
  {
    std::ofstream f("/tmp/sketchdb_csv_file");
    f << "x";
  }
  CsvLog log("/tmp/sketchdb_csv_file/log.csv", {"a"});
  ASSERT_TRUE(log.error());
  ASSERT_TRUE(log.append({"1"}));
}

}  // namespace disk
}  // namespace sketchdb

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
