#pragma once

#include <boost/log/trivial.hpp>
#include <format>
#include <string>
#include <string_view>

namespace largest {
namespace logging {

enum class sink_type { null, file, console };

enum class level { trace, debug, info, error };

// Installs a single sink and drops records below lvl. The console sink
// writes to std::clog so that records stay off standard output. Throws
// std::runtime_error, leaving the current sinks in place, when the file
// sink cannot open name. Sink failures after that are dropped.
void init(level lvl, sink_type t, const std::string &name = "");

// Accepts "trace", "debug", "info" or "error".
auto parse_level(std::string_view name) -> level;

void write(level lvl, std::string_view message);

template <typename... Args>
void write(level lvl, std::format_string<Args...> fmt, Args &&...args) {
    write(lvl, std::string_view(std::format(fmt, std::forward<Args>(args)...)));
}
}  // namespace logging
}  // namespace largest
