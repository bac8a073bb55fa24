#ifndef ECRS_LOGGER_HPP
#define ECRS_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace ecrs::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a console sink on std::clog and, if log_file is not empty, a
// text file sink truncated on open. Messages below min_level are dropped.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = severity_level::warning);

// Changes the severity filter of an initialized logging core
void set_log_level(severity_level min_level);

// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a level
std::optional<severity_level> parse_severity(const std::string& name);

} // namespace ecrs::logging

#endif // ECRS_LOGGER_HPP
