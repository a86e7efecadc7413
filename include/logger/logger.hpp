#ifndef GNTP_LOGGER_HPP
#define GNTP_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace logger {

/**
 * Installs a console sink and, when log_file is not empty, a text file sink
 * rotated at 10 MB. Records below min_level are dropped. Replaces any sinks
 * installed earlier.
 */
void init_logging(const std::string& log_file = "",
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info);

} // namespace logger
} // namespace gntp

#endif // GNTP_LOGGER_HPP
