#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "logging.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace libctdi {

/// Settings for the ctdic tool, read from a YAML file:
///
///   log:
///     level: info
///     pattern: "[%Severity%] %Message%"
///   compile:
///     validate_providers: true
///     subtype_resolution: true
///     primitive_name_matching: true
///     strict_imports: false
///     warnings_as_errors: false
///
/// Every key is optional; missing keys keep their defaults.
struct tool_config {
    log::log_config log;
    compile_options compile;
};

/// Throws invalid_declaration on unknown levels or non-boolean switches.
LIBCTDI_EXPORT tool_config parse_tool_config(const YAML::Node& root,
                                             const std::string& document_name = "<config>");

LIBCTDI_EXPORT tool_config load_tool_config(const std::string& path);

} // namespace libctdi
