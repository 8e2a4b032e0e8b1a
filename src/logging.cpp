#include "libctdi/logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace logging = boost::log;

namespace libctdi::log {

namespace {

logging::trivial::severity_level to_boost_level(level lvl) {
    switch (lvl) {
        case level::trace:   return logging::trivial::trace;
        case level::debug:   return logging::trivial::debug;
        case level::info:    return logging::trivial::info;
        case level::warning: return logging::trivial::warning;
        case level::error:   return logging::trivial::error;
        case level::fatal:   return logging::trivial::fatal;
    }
    return logging::trivial::info;
}

std::atomic<bool> configured{false};

} // namespace

void install_default_filter() {
    static std::once_flag installed;
    std::call_once(installed, [] {
        if (!configured.load()) set_level(log_config{}.minimum);
    });
}

void init(const log_config& config) {
    static std::once_flag registered;
    std::call_once(registered, [] {
        logging::register_simple_formatter_factory<
            logging::trivial::severity_level, char>("Severity");
        logging::add_common_attributes();
    });

    logging::core::get()->remove_all_sinks();

    if (config.console) {
        // Diagnostics go to stderr; stdout carries the wiring plan.
        logging::add_console_log(
            std::clog,
            logging::keywords::format = logging::parse_formatter(config.pattern));
    }

    set_level(config.minimum);
    configured.store(true);
}

void shutdown() {
    logging::core::get()->remove_all_sinks();
}

void set_level(level lvl) {
    logging::core::get()->set_filter(
        logging::trivial::severity >= to_boost_level(lvl));
}

std::optional<level> level_from_string(std::string_view text) {
    if (text == "trace") return level::trace;
    if (text == "debug") return level::debug;
    if (text == "info") return level::info;
    if (text == "warning" || text == "warn") return level::warning;
    if (text == "error") return level::error;
    if (text == "fatal") return level::fatal;
    return std::nullopt;
}

std::string_view to_string(level lvl) noexcept {
    constexpr std::string_view names[] = {
        "trace", "debug", "info", "warning", "error", "fatal"};
    return names[static_cast<int>(lvl)];
}

} // namespace libctdi::log
