#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace gntp {
namespace logger {

void init_logging(const std::string& log_file, boost::log::trivial::severity_level min_level) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    const logging::formatter format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage
    );

    logging::add_console_log(
      std::clog,
      keywords::format = format,
      keywords::auto_flush = true
    );

    if (!log_file.empty()) {
      // Convert to absolute path
      const std::filesystem::path log_path = std::filesystem::absolute(log_file);
      logging::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::format = format,
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::auto_flush = true
      );
    }

    logging::core::get()->set_filter(logging::trivial::severity >= min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

} // namespace logger
} // namespace gntp
