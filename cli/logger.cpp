#include "logger.hpp"

#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>

void Logger::init(bool quiet, int verbosity) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    logging::add_console_log(
        std::clog,
        keywords::format = (
            expr::stream
                << "[" << logging::trivial::severity << "] "
                << expr::smessage
        ),
        keywords::auto_flush = true
    );

    logging::core::get()->set_filter(
        logging::trivial::severity >= thresholdFor(verbosity)
    );
    logging::core::get()->set_logging_enabled(!quiet);
}

Logger::severity_level Logger::thresholdFor(int verbosity) {
    switch (verbosity) {
        case 0:  return boost::log::trivial::warning;
        case 1:  return boost::log::trivial::info;
        case 2:  return boost::log::trivial::debug;
        default: return verbosity < 0 ? boost::log::trivial::warning
                                      : boost::log::trivial::trace;
    }
}
