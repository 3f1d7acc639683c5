#include "disk/CsvLog.hpp"

#include <boost/filesystem.hpp>

#include "base/Logging.hpp"

namespace sketchdb {
namespace disk {

std::string csv_escape(const std::string& field) {
  if (field.find_first_of(",\"\n\r") == std::string::npos) return field;
  std::string s("\"");
  for (char c : field) {
    if (c == '"') s.push_back('"');
    s.push_back(c);
  }
  s.push_back('"');
  return s;
}

CsvLog::CsvLog(const std::string& path, const std::vector<std::string>& header)
    : path_(path) {
  boost::filesystem::path p(path);
  boost::system::error_code ec;
  if (p.has_parent_path()) {
    boost::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      err_.set("cannot create " + p.parent_path().string() + ": " +
               ec.message());
      LOG_ERROR << err_.error();
      return;
    }
  }
  bool fresh = !boost::filesystem::exists(p, ec) ||
               boost::filesystem::file_size(p, ec) == 0;
  out_.open(path, std::ios::out | std::ios::app);
  if (!out_.is_open()) {
    err_.set("cannot open " + path);
    LOG_ERROR << err_.error();
    return;
  }
  if (fresh) {
    error::Error err = append(header);
    if (err) err_ = err;
  }
}

error::Error CsvLog::append(const std::vector<std::string>& row) {
  if (!out_.is_open()) return error::Error("csv log " + path_ + " not open");
  std::string line;
  for (size_t i = 0; i < row.size(); i++) {
    if (i > 0) line.push_back(',');
    line.append(csv_escape(row[i]));
  }
  line.push_back('\n');

  base::MutexLockGuard lock(mutex_);
  out_ << line;
  out_.flush();
  if (!out_.good()) return error::Error("write " + path_ + " failed");
  return error::Error();
}

}  // namespace disk
}  // namespace sketchdb
