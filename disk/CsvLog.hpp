#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "base/Error.hpp"
#include "base/Mutex.hpp"

namespace sketchdb {
namespace disk {

// CsvLog appends rows to a CSV file. The header is written only when the file
// is new or empty, so restarts keep appending to the same table.
class CsvLog : boost::noncopyable {
 private:
  base::MutexLock mutex_;
  std::string path_;
  std::ofstream out_;
  error::Error err_;

 public:
  CsvLog(const std::string& path, const std::vector<std::string>& header);

  // Fields containing a comma, quote or newline are quoted.
  error::Error append(const std::vector<std::string>& row);

  const std::string& path() const { return path_; }
  error::Error error() const { return err_; }
};

std::string csv_escape(const std::string& field);

}  // namespace disk
}  // namespace sketchdb
