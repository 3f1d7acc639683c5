#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <iostream>

#include "base/Logging.hpp"
#include "db/DB.hpp"

namespace po = boost::program_options;

using sketchdb::db::DB;
using sketchdb::db::Options;

namespace {

po::options_description make_description() {
  po::options_description desc("sketchd options");
  // clang-format off
  desc.add_options()
    ("help,h", "Print this message")
    ("config", po::value<std::string>(), "YAML configuration file");
  // clang-format on
  for (const std::string& key : Options::keys())
    desc.add_options()(key.c_str(), po::value<std::string>(),
                       ("Override option " + key).c_str());
  return desc;
}

}  // namespace

int main(int argc, char** argv) {
  po::options_description desc = make_description();
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl << desc << std::endl;
    return 1;
  }
  if (vm.count("help")) {
    std::cout << desc << std::endl;
    return 0;
  }

  Options opts;
  sketchdb::error::Error err;
  if (vm.count("config")) err = opts.load_yaml_file(vm["config"].as<std::string>());
  if (!err) err = opts.load_env();
  for (const std::string& key : Options::keys()) {
    if (err) break;
    if (vm.count(key)) err = opts.set(key, vm[key].as<std::string>());
  }
  if (!err) err = opts.validate();
  if (err) LOG_FATAL << "invalid options: " << err.error();
  sketchdb::base::Logger::set_log_level(opts.log_level);

  DB db(opts);
  err = db.start();
  if (err) LOG_FATAL << err.error();

  boost::asio::io_context io;
  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& ec, int signum) {
    if (ec) {
      LOG_ERROR << "signal wait: " << ec.message();
      return;
    }
    LOG_INFO << "signal " << signum << " received, stopping";
  });
  io.run();
  db.stop();
  return 0;
}
