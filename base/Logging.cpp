#include "base/Logging.hpp"

#include <sys/syscall.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace sketchdb {
namespace base {

namespace {

std::atomic<int> g_log_level(Logger::INFO);

const char* LogLevelName[Logger::NUM_LOG_LEVELS] = {
    "TRACE ", "DEBUG ", "INFO  ", "WARN  ", "ERROR ", "FATAL ",
};

void default_output(const char* msg, int len) {
  size_t n = fwrite(msg, 1, static_cast<size_t>(len), stderr);
  (void)n;
}

void default_flush() { fflush(stderr); }

std::atomic<Logger::OutputFunc> g_output(default_output);
std::atomic<Logger::FlushFunc> g_flush(default_flush);

__thread int t_cached_tid = 0;

int current_tid() {
  if (t_cached_tid == 0)
    t_cached_tid = static_cast<int>(::syscall(SYS_gettid));
  return t_cached_tid;
}

const char* basename(const char* file) {
  const char* slash = strrchr(file, '/');
  return slash ? slash + 1 : file;
}

}  // namespace

Logger::Logger(const char* file, int line, LogLevel level) : level_(level) {
  format_header(file, line, nullptr);
}

Logger::Logger(const char* file, int line, LogLevel level, const char* func)
    : level_(level) {
  format_header(file, line, func);
}

void Logger::format_header(const char* file, int line, const char* func) {
  struct timeval tv;
  gettimeofday(&tv, NULL);
  struct tm tm_time;
  time_t seconds = tv.tv_sec;
  gmtime_r(&seconds, &tm_time);

  char buf[64];
  snprintf(buf, sizeof(buf), "%4d%02d%02d %02d:%02d:%02d.%06dZ ",
           tm_time.tm_year + 1900, tm_time.tm_mon + 1, tm_time.tm_mday,
           tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec,
           static_cast<int>(tv.tv_usec));
  stream_ << buf << current_tid() << ' ' << LogLevelName[level_]
          << basename(file) << ':' << line << ' ';
  if (func) stream_ << func << "() ";
}

Logger::~Logger() {
  stream_ << '\n';
  const std::string msg = stream_.str();
  g_output.load()(msg.data(), static_cast<int>(msg.size()));
  if (level_ >= ERROR) g_flush.load()();
  if (level_ == FATAL) {
    g_flush.load()();
    abort();
  }
}

Logger::LogLevel Logger::log_level() {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

void Logger::set_log_level(LogLevel level) { g_log_level.store(level); }

bool Logger::parse_log_level(const std::string& name, LogLevel* level) {
  static const char* names[NUM_LOG_LEVELS] = {"trace", "debug", "info",
                                              "warn",  "error", "fatal"};
  for (int i = 0; i < NUM_LOG_LEVELS; i++) {
    if (name == names[i]) {
      *level = static_cast<LogLevel>(i);
      return true;
    }
  }
  return false;
}

bool Logger::set_log_level(const std::string& name) {
  LogLevel level;
  if (!parse_log_level(name, &level)) return false;
  set_log_level(level);
  return true;
}

void Logger::set_output(OutputFunc out) { g_output.store(out); }

void Logger::set_flush(FlushFunc flush) { g_flush.store(flush); }

}  // namespace base
}  // namespace sketchdb
