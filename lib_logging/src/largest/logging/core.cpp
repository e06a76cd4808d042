#include "largest/logging/core.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/exception_handler.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

const auto format = "[%TimeStamp%] [%Severity%] %Message%";

namespace largest {
namespace logging {
namespace {
auto to_severity(level lvl) -> boost::log::trivial::severity_level {
    switch (lvl) {
        case level::trace:
            return boost::log::trivial::trace;
        case level::debug:
            return boost::log::trivial::debug;
        case level::info:
            return boost::log::trivial::info;
        case level::error:
            return boost::log::trivial::error;
    }
    std::unreachable();
}

// The file backend opens lazily, so an unusable path would otherwise only
// surface on the first record.
void check_writable(const std::string &name) {
    std::ofstream file(name, std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("cannot open log file {}: {}",
                                             name, std::strerror(errno)));
    }
}
}  // namespace

void init(level lvl, sink_type t, const std::string &name) {
    if (t == sink_type::file) {
        check_writable(name);
    }
    boost::log::core::get()->remove_all_sinks();
    boost::log::core::get()->set_exception_handler(
        boost::log::make_exception_suppressor());
    boost::log::add_common_attributes();
    boost::log::core::get()->set_filter(boost::log::trivial::severity >=
                                        to_severity(lvl));
    switch (t) {
        case sink_type::null:
            // Without a sink Boost.Log falls back to printing everything
            // to the console.
            boost::log::core::get()->set_logging_enabled(false);
            return;
        case sink_type::file: {
            boost::log::add_file_log(boost::log::keywords::file_name = name,
                                     boost::log::keywords::auto_flush = true,
                                     boost::log::keywords::format = format);
            break;
        }
        case sink_type::console: {
            boost::log::add_console_log(std::clog,
                                        boost::log::keywords::auto_flush = true,
                                        boost::log::keywords::format = format);
            break;
        }
    }
    boost::log::core::get()->set_logging_enabled(true);
}

auto parse_level(std::string_view name) -> level {
    if (name == "trace") {
        return level::trace;
    }
    if (name == "debug") {
        return level::debug;
    }
    if (name == "info") {
        return level::info;
    }
    if (name == "error") {
        return level::error;
    }
    throw std::invalid_argument(std::format("unknown log level: {}", name));
}

void write(level lvl, std::string_view message) {
    switch (lvl) {
        case level::trace:
            BOOST_LOG_TRIVIAL(trace) << message;
            break;
        case level::debug:
            BOOST_LOG_TRIVIAL(debug) << message;
            break;
        case level::info:
            BOOST_LOG_TRIVIAL(info) << message;
            break;
        case level::error:
            BOOST_LOG_TRIVIAL(error) << message;
            break;
    }
}
}  // namespace logging
}  // namespace largest
