#ifndef TREETOOL_LOGGER_HPP
#define TREETOOL_LOGGER_HPP

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>

/**
 * @brief Process-wide diagnostics for the treetool command line
 *
 * Messages go to stderr as "[severity] message". Only the command line layer
 * logs; the treeindex library reports through return values and exceptions.
 */
class Logger {
public:
    using severity_level = boost::log::trivial::severity_level;

    /**
     * @brief Installs the stderr sink
     *
     * @param quiet Disable all log output
     * @param verbosity Number of -v flags: 0 shows warnings and errors, 1 adds
     *                  info, 2 adds debug, 3 or more adds trace
     */
    static void init(bool quiet, int verbosity);

    static severity_level thresholdFor(int verbosity);

    static boost::log::sources::severity_logger<severity_level>& get_logger() {
        static boost::log::sources::severity_logger<severity_level> logger;
        return logger;
    }
};

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(Logger::get_logger(), boost::log::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(Logger::get_logger(), boost::log::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(Logger::get_logger(), boost::log::trivial::info)
#define LOG_WARN BOOST_LOG_SEV(Logger::get_logger(), boost::log::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(Logger::get_logger(), boost::log::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(Logger::get_logger(), boost::log::trivial::fatal)

#endif // TREETOOL_LOGGER_HPP
