#ifndef CHUNKVAULT_LOGGER_HPP
#define CHUNKVAULT_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace chunkvault::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a synchronous text file sink (and optionally a console sink) on the
// Boost.Log core. Replaces any sinks installed before.
void init_logging(const std::string& log_file = "chunkvault.log",
                  severity_level min_level = boost::log::trivial::info,
                  bool console = false);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// "trace" .. "fatal", case-insensitive. Throws InvalidConfiguration for anything else.
severity_level parse_severity(const std::string& name);

} // namespace chunkvault::logging

#endif // CHUNKVAULT_LOGGER_HPP
