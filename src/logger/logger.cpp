#include "logger/logger.hpp"
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include "config/config.hpp"

namespace mailchunk {
namespace logging {

namespace {

namespace expr = boost::log::expressions;

auto record_format() {
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "]"
      << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
      << expr::smessage;
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(record_format());

    boost::log::core::get()->add_sink(sink);
    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity_level min_level) {
  boost::log::core::get()->remove_all_sinks();

  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
  auto sink = boost::make_shared<text_sink>(backend);
  sink->set_formatter(record_format());

  boost::log::core::get()->add_sink(sink);
  boost::log::add_common_attributes();
  set_log_level(min_level);
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

severity_level parse_severity(const std::string& name) {
  severity_level level;
  if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    throw config::ConfigurationError("Logger: Unknown log level: " + name);
  }
  return level;
}

} // namespace logging
} // namespace mailchunk
