#include "ingest/ThroughputMonitor.hpp"

#include "base/Logging.hpp"
#include "base/TimeStamp.hpp"

namespace sketchdb {
namespace ingest {

ThroughputMonitor::ThroughputMonitor(IngestRouter* router, int64_t interval_ms,
                                     disk::CsvLog* log)
    : router_(router),
      interval_ms_(interval_ms),
      log_(log),
      cond_(mutex_),
      running_(false),
      last_total_(router->total_ingested()),
      last_ms_(base::now_millis()) {}

ThroughputMonitor::~ThroughputMonitor() { stop(); }

void ThroughputMonitor::start() {
  base::MutexLockGuard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_.reset(new std::thread(&ThroughputMonitor::loop, this));
}

void ThroughputMonitor::stop() {
  {
    base::MutexLockGuard lock(mutex_);
    if (!running_) return;
    running_ = false;
    cond_.notify_all();
  }
  if (thread_ && thread_->joinable()) thread_->join();
}

double ThroughputMonitor::sample(int64_t now_ms) {
  uint64_t total = router_->total_ingested();
  int64_t elapsed = now_ms - last_ms_;
  double rate = 0;
  if (elapsed > 0)
    rate = static_cast<double>(total - last_total_) * 1000.0 /
           static_cast<double>(elapsed);
  last_total_ = total;
  last_ms_ = now_ms;

  LOG_INFO << "[INGEST SPEED] " << rate << " samples/sec, total " << total;
  if (log_) {
    error::Error err = log_->append(
        {std::to_string(now_ms), std::to_string(rate), std::to_string(total)});
    if (err) LOG_WARN << err.error();
  }
  return rate;
}

void ThroughputMonitor::loop() {
  while (true) {
    {
      base::MutexLockGuard lock(mutex_);
      if (!running_) break;
      cond_.wait_for_millis(interval_ms_);
      if (!running_) break;
    }
    sample(base::now_millis());
  }
}

}  // namespace ingest
}  // namespace sketchdb
