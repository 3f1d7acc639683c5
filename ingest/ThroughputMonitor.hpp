#pragma once

#include <memory>
#include <thread>

#include "base/Mutex.hpp"
#include "disk/CsvLog.hpp"
#include "ingest/IngestRouter.hpp"

namespace sketchdb {
namespace ingest {

// ThroughputMonitor samples the ingest counter every interval_ms, logs the
// rate and appends a row to the throughput log.
class ThroughputMonitor : boost::noncopyable {
 private:
  IngestRouter* router_;
  int64_t interval_ms_;
  disk::CsvLog* log_;

  base::MutexLock mutex_;
  base::Condition cond_;
  bool running_;
  std::unique_ptr<std::thread> thread_;

  uint64_t last_total_;
  int64_t last_ms_;

  void loop();

 public:
  // log may be nullptr.
  ThroughputMonitor(IngestRouter* router, int64_t interval_ms,
                    disk::CsvLog* log);
  ~ThroughputMonitor();

  void start();
  void stop();

  // Returns samples per second since the previous call.
  double sample(int64_t now_ms);
};

}  // namespace ingest
}  // namespace sketchdb
