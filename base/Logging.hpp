#ifndef LOGGING_H
#define LOGGING_H

#include <boost/noncopyable.hpp>
#include <sstream>
#include <string>

namespace sketchdb {
namespace base {

class Logger : boost::noncopyable {
 public:
  enum LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    NUM_LOG_LEVELS,
  };

  typedef void (*OutputFunc)(const char* msg, int len);
  typedef void (*FlushFunc)();

  Logger(const char* file, int line, LogLevel level);
  Logger(const char* file, int line, LogLevel level, const char* func);
  ~Logger();

  std::ostringstream& stream() { return stream_; }

  static LogLevel log_level();
  static void set_log_level(LogLevel level);
  // Accepts trace/debug/info/warn/error/fatal. Returns false on unknown names.
  static bool set_log_level(const std::string& name);
  static bool parse_log_level(const std::string& name, LogLevel* level);

  static void set_output(OutputFunc out);
  static void set_flush(FlushFunc flush);

 private:
  void format_header(const char* file, int line, const char* func);

  std::ostringstream stream_;
  LogLevel level_;
};

}  // namespace base
}  // namespace sketchdb

#define LOG_TRACE                                                 \
  if (::sketchdb::base::Logger::log_level() <=                    \
      ::sketchdb::base::Logger::TRACE)                            \
  ::sketchdb::base::Logger(__FILE__, __LINE__,                    \
                           ::sketchdb::base::Logger::TRACE, __func__) \
      .stream()
#define LOG_DEBUG                                                 \
  if (::sketchdb::base::Logger::log_level() <=                    \
      ::sketchdb::base::Logger::DEBUG)                            \
  ::sketchdb::base::Logger(__FILE__, __LINE__,                    \
                           ::sketchdb::base::Logger::DEBUG, __func__) \
      .stream()
#define LOG_INFO                                                          \
  if (::sketchdb::base::Logger::log_level() <=                            \
      ::sketchdb::base::Logger::INFO)                                     \
  ::sketchdb::base::Logger(__FILE__, __LINE__, ::sketchdb::base::Logger::INFO) \
      .stream()
#define LOG_WARN                                                          \
  if (::sketchdb::base::Logger::log_level() <=                            \
      ::sketchdb::base::Logger::WARN)                                     \
  ::sketchdb::base::Logger(__FILE__, __LINE__, ::sketchdb::base::Logger::WARN) \
      .stream()
#define LOG_ERROR                                                   \
  ::sketchdb::base::Logger(__FILE__, __LINE__,                      \
                           ::sketchdb::base::Logger::ERROR).stream()
#define LOG_FATAL                                                   \
  ::sketchdb::base::Logger(__FILE__, __LINE__,                      \
                           ::sketchdb::base::Logger::FATAL).stream()

#endif
