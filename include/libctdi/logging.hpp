#pragma once

/// @file logging.hpp
/// Thin layer over the Boost.Log trivial logger.  The library only writes
/// records; sinks and the severity filter are installed by the application
/// through log::init().

#include "export.hpp"

#include <boost/log/trivial.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace libctdi::log {

enum class level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

struct log_config {
    level minimum = level::warning;
    bool  console = true;
    /// Boost.Log formatter string.
    std::string pattern = "[%Severity%] %Message%";
};

/// Install the console sink and severity filter.  Safe to call again;
/// previous sinks are replaced.
LIBCTDI_EXPORT void init(const log_config& config);

/// Apply the default `warning` filter unless init() already ran.  Every
/// pipeline entry point calls this, so records below `warning` stay quiet
/// in applications that never configure logging.  Runs at most once.
LIBCTDI_EXPORT void install_default_filter();

/// Remove all sinks.
LIBCTDI_EXPORT void shutdown();

/// Change the severity filter without touching sinks.
LIBCTDI_EXPORT void set_level(level lvl);

/// "trace" .. "fatal" (also accepts "warn"); nullopt for anything else.
LIBCTDI_EXPORT std::optional<level> level_from_string(std::string_view text);

LIBCTDI_EXPORT std::string_view to_string(level lvl) noexcept;

} // namespace libctdi::log

#define LIBCTDI_LOG_TRACE   BOOST_LOG_TRIVIAL(trace)
#define LIBCTDI_LOG_DEBUG   BOOST_LOG_TRIVIAL(debug)
#define LIBCTDI_LOG_INFO    BOOST_LOG_TRIVIAL(info)
#define LIBCTDI_LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define LIBCTDI_LOG_ERROR   BOOST_LOG_TRIVIAL(error)
#define LIBCTDI_LOG_FATAL   BOOST_LOG_TRIVIAL(fatal)
