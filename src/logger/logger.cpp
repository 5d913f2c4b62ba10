#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace objstore::logging {

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

// Severity level to string conversion
const char* to_string(severity_level level) {
    switch (level) {
        case severity_level::trace:   return "TRACE";
        case severity_level::debug:   return "DEBUG";
        case severity_level::info:    return "INFO";
        case severity_level::warning: return "WARNING";
        case severity_level::error:   return "ERROR";
        case severity_level::fatal:   return "FATAL";
        default:                      return "UNKNOWN";
    }
}

// Custom formatting operator for severity_level
std::ostream& operator<<(std::ostream& strm, severity_level level) {
    strm << to_string(level);
    return strm;
}

namespace {

auto make_formatter() {
    namespace expr = boost::log::expressions;
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << severity << "]"
        << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
        << expr::smessage;
}

} // namespace

void init_logging(severity_level min_level, const std::string& log_file) {
    try {
        auto core = boost::log::core::get();

        // Clear any existing sinks
        core->remove_all_sinks();

        // Console sink writing to stdout
        using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
        auto console_backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
        console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::cout, boost::null_deleter()));
        console_backend->auto_flush(true);
        auto console = boost::make_shared<console_sink>(console_backend);
        console->set_formatter(make_formatter());
        core->add_sink(console);

        if (!log_file.empty()) {
            // Create and configure text file sink backend
            auto file_backend = boost::make_shared<boost::log::sinks::text_file_backend>();
            std::filesystem::path log_path = std::filesystem::absolute(log_file);
            file_backend->set_file_name_pattern(log_path.string());
            file_backend->set_open_mode(std::ios::out | std::ios::app);
            file_backend->set_rotation_size(10 * 1024 * 1024);  // 10 MB
            file_backend->auto_flush(true);

            using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
            auto file = boost::make_shared<file_sink>(file_backend);
            file->set_formatter(make_formatter());
            core->add_sink(file);
        }

        boost::log::add_common_attributes();
        core->set_filter(severity >= min_level);
        core->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void shutdown_logging() {
    auto core = boost::log::core::get();
    core->flush();
    core->remove_all_sinks();
}

} // namespace objstore::logging
