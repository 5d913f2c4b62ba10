#ifndef OBJSTORE_LOGGER_HPP
#define OBJSTORE_LOGGER_HPP

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <ostream>
#include <string>

namespace objstore::logging {

// Define severity levels
enum class severity_level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

// Convert severity level to string for formatting
const char* to_string(severity_level level);
std::ostream& operator<<(std::ostream& strm, severity_level level);

// Logger instances are created by the process entry point and handed to
// the components that log; nothing below main reaches for a global one.
using Logger = boost::log::sources::severity_logger_mt<severity_level>;

// Installs a console sink and, when log_file is not empty, a text file sink.
// Records below min_level are dropped by the core filter.
void init_logging(severity_level min_level = severity_level::info,
                  const std::string& log_file = "");

// Removes every sink installed by init_logging
void shutdown_logging();

} // namespace objstore::logging

// Convenience macros for logging
#define OBJSTORE_LOG_TRACE(lg) BOOST_LOG_SEV(lg, objstore::logging::severity_level::trace)
#define OBJSTORE_LOG_DEBUG(lg) BOOST_LOG_SEV(lg, objstore::logging::severity_level::debug)
#define OBJSTORE_LOG_INFO(lg) BOOST_LOG_SEV(lg, objstore::logging::severity_level::info)
#define OBJSTORE_LOG_WARN(lg) BOOST_LOG_SEV(lg, objstore::logging::severity_level::warning)
#define OBJSTORE_LOG_ERROR(lg) BOOST_LOG_SEV(lg, objstore::logging::severity_level::error)
#define OBJSTORE_LOG_FATAL(lg) BOOST_LOG_SEV(lg, objstore::logging::severity_level::fatal)

#endif // OBJSTORE_LOGGER_HPP
